// ==========================================================================
//  Доступ к свойствам интерфейсных объектов устройства.
//
//  PropertyTransport - общий интерфейс двух способов доступа:
//    RemoteTransport - запросы к удаленному устройству через разделяемый канал;
//    LocalTransport  - собственное подключение к локальной службе управления.
// ==========================================================================
#pragma once
#ifndef MGMT_TRANSPORT_HPP
#define MGMT_TRANSPORT_HPP

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <atomic>
#include <string>

#include "mgmt_error.hpp"
#include "mgmt_description.hpp"
#include "mgmt_link.hpp"

namespace mgmt {

class PropertyTransport;

typedef enum {
  // Закрыт вызовом close()
  CLOSED_BY_USER = 1,
  // Закрыт нижележащий канал
  CLOSED_BY_LINK = 2
} close_initiator_t;

class CloseEvent
{
  public:
    CloseEvent(PropertyTransport* _source, close_initiator_t _initiator, const std::string& _reason)
      : m_source(_source), m_initiator(_initiator), m_reason(_reason) {};

    PropertyTransport* source() const { return m_source; };
    close_initiator_t initiator() const { return m_initiator; };
    const std::string& reason() const { return m_reason; };

  private:
    PropertyTransport* m_source;
    close_initiator_t  m_initiator;
    std::string        m_reason;
};

// Получатель уведомления о закрытии транспорта
class TransportListener
{
  public:
    virtual ~TransportListener() {};
    virtual void transport_closed(const CloseEvent&) = 0;
};

// ==========================================================================
class PropertyTransport
{
  public:
    PropertyTransport(const std::string&, TransportListener*, const std::string&);
    virtual ~PropertyTransport();

    // Прочитать count элементов свойства pid объекта object_index, начиная с start.
    // Элемент 0 содержит текущее количество элементов свойства.
    virtual Error get_property(int, int, int, int, std::string&);
    virtual Error set_property(int, int, int, int, const std::string&);
    // Описание свойства по идентификатору
    virtual Error get_description(int, int, Description&);
    // Описание свойства по его порядковому номеру в объекте
    virtual Error get_description_by_index(int, int, Description&);

    // Авторизация ключом. level получает предоставленный уровень доступа.
    virtual Error authorize(const std::string&, int&);

    // Текущий уровень доступа, ACCESS_LEVEL_FREE до успешной авторизации
    int  access_level() const { return m_access_level; };
    // Ключ, заданный при создании транспорта
    const std::string& key() const { return m_key; };
    bool has_key() const { return !m_key.empty(); };

    const std::string& name() const { return m_name; };
    bool is_open() const { return m_open; };

    // Таймаут ожидания ответа, мсек
    void set_timeout(int _timeout) { m_timeout = _timeout; };
    int  timeout() const { return m_timeout; };

    // Закрыть транспорт. Повторные вызовы ничего не делают.
    virtual void close() = 0;

  protected:
    // Обмен запросом и ответом с устройством. Статус ответа преобразуется
    // в код ошибки, после закрытия транспорта - rtE_ILLEGAL_STATE.
    virtual Error request(KNXMGMT::PropertyRequest&, KNXMGMT::PropertyResponse&) = 0;
    // Разобрать ответ с описанием свойства
    Error read_description(KNXMGMT::PropertyRequest&, Description&);
    // Перевод в закрытое состояние. true, если переход выполнен этим вызовом.
    bool mark_closed();
    // Уведомить получателя о закрытии
    void notify_closed(close_initiator_t, const std::string&);
    // rtE_ILLEGAL_STATE для закрытого транспорта
    Error check_open() const;
    // Описание свойства по ответу устройства. Если устройство не сообщило
    // тип объекта или текущее количество элементов, они читаются отдельно.
    Error complete_description(const KNXMGMT::PropertyDescription&, Description&);

    std::string        m_name;
    TransportListener *m_listener;
    std::string        m_key;
    std::atomic<int>   m_access_level;
    int                m_timeout;

  private:
    DISALLOW_COPY_AND_ASSIGN(PropertyTransport);
    std::atomic<bool>  m_open;
};

} // namespace mgmt

#endif
