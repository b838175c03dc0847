#pragma once
#ifndef MGMT_ERROR_HPP
#define MGMT_ERROR_HPP

#if defined HAVE_CONFIG_H
#include "config.h"
#endif

#include <string>
#include <ostream>

namespace mgmt {

typedef enum
{
  rtE_NONE              = 0,
  rtE_UNKNOWN           = 1,
  // Транспорт или клиент уже закрыт
  rtE_ILLEGAL_STATE     = 2,
  // Не получен ответ за отведенное время
  rtE_TIMEOUT           = 3,
  // Значение не соответствует формату или диапазону типа
  rtE_FORMAT            = 4,
  // Нет свойства (объекта) с указанным идентификатором или индексом
  rtE_NO_SUCH_PROPERTY  = 5,
  rtE_ACCESS_DENIED     = 6,
  // Для свойства неизвестен тип данных либо для типа нет транслятора
  rtE_UNKNOWN_TYPE      = 7,
  rtE_ILLEGAL_PARAMETER_VALUE = 8,
  rtE_NOT_SUPPORTED     = 9,
  // Ошибка канала связи
  rtE_LINK              = 10,
  // Устройство сообщило об ошибке выполнения запроса
  rtE_REMOTE            = 11,
  rtE_CONFIG            = 12,
  rtE_LAST              = 13
} ErrorCode_t;

class Error
{
  public:
    static const int MaxErrorCode = rtE_LAST;
    // Пустая инициализация
    Error();
    // Инициализация по образцу
    Error(const Error&);
    // Инициализация по коду
    Error(ErrorCode_t);
    // Инициализация по коду с уточнением
    Error(ErrorCode_t, const std::string&);

    ~Error();

    Error& operator=(const Error&);
    // Получить код ошибки
    int getCode() const;
    ErrorCode_t code() const { return m_error_code; };
    // Установить код ошибки
    void set(ErrorCode_t);
    void set(ErrorCode_t, const std::string&);
    // Установить код ошибки
    void set(const Error& _err) { m_error_code = _err.m_error_code; m_detail = _err.m_detail; };
    // true, если не было ошибки
    bool Ok() const { return m_error_code == rtE_NONE; };
    // true, если была ошибка
    bool NOk() const { return m_error_code != rtE_NONE; };

    // Сбросить код ошибки
    void clear() { m_error_code = rtE_NONE; m_detail.clear(); };
    // Получить символьное описание ошибки
    const char* what() const;
    static const char* what(int);
    // Уточнение, например ошибочное значение
    const std::string& detail() const { return m_detail; };

  private:
    ErrorCode_t  m_error_code;
    std::string  m_detail;
};

std::ostream& operator<<(std::ostream&, const Error&);

} //namespace mgmt

#endif
