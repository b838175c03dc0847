// ==========================================================================
//  Трансляторы значений точек данных (Datapoint Types, DPT)
//
//  Транслятор хранит одно или несколько значений одного типа DPT в
//  двоичном виде, как они передаются в свойство устройства, и выполняет
//  преобразование в текст и обратно.
// ==========================================================================
#pragma once
#ifndef DPT_TRANSLATOR_HPP
#define DPT_TRANSLATOR_HPP

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

// Общесистемные заголовочные файлы
#include <stdint.h>
#include <string>
#include <vector>

// Служебные файлы KNXMGMT
#include "mgmt_error.hpp"

namespace dpt {

// Описание типа точки данных
typedef struct {
  // Идентификатор "главный.дополнительный", например "29.010"
  const char* id;
  const char* description;
  // Границы допустимых значений, в текстовом виде
  const char* lower;
  const char* upper;
  // Единица измерения, может быть пустой
  const char* unit;
} DPT;

class Translator
{
  public:
    Translator(const DPT&, size_t);
    virtual ~Translator();

    const DPT& type() const { return m_dpt; };
    // Размер одного элемента в байтах
    size_t type_size() const { return m_type_size; };
    // Количество хранимых элементов
    size_t items() const { return m_data.size() / m_type_size; };

    // Заменить содержимое одним значением, заданным текстом.
    // При ошибке формата или диапазона содержимое не изменяется.
    mgmt::Error set_value(const std::string&);
    // Заменить содержимое несколькими значениями, все или ничего
    mgmt::Error set_values(const std::vector<std::string>&);

    // Первый элемент в текстовом виде
    std::string value() const;
    std::vector<std::string> all_values() const;
    // Первый элемент в числовом виде
    virtual double numeric_value() const = 0;

    // Загрузить двоичное содержимое. Длина должна быть кратна размеру элемента.
    mgmt::Error set_data(const std::string&);
    const std::string& data() const { return m_data; };

    // Дополнять ли текстовое значение единицей измерения (по умолчанию да)
    void set_append_unit(bool _append) { m_append_unit = _append; };
    bool unit_appended() const { return m_append_unit; };

  protected:
    // Закодировать текст (уже без единицы измерения) в элемент index буфера dst
    virtual mgmt::Error to_dpt(const std::string&, std::string&, size_t) const = 0;
    // Текстовое представление элемента без единицы измерения
    virtual std::string make_string(size_t) const = 0;

    std::string append_unit(const std::string&) const;
    std::string remove_unit(const std::string&) const;

    // Разбор целого числа со знаком: десятичная, шестнадцатеричная
    // ("0x", "0X", "#") или восьмеричная (ведущий "0") запись.
    // false, если текст не является числом или число не помещается в 64 бита.
    static bool decode_number(const std::string&, bool&, uint64_t&);

    const DPT&  m_dpt;
    const size_t m_type_size;
    std::string m_data;

  private:
    DISALLOW_COPY_AND_ASSIGN(Translator);
    bool m_append_unit;
};

} // namespace dpt

#endif
