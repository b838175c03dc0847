#pragma once
#ifndef MGMT_TRANSPORT_LOCAL_HPP
#define MGMT_TRANSPORT_LOCAL_HPP

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <string>

#include "mgmt_link.hpp"
#include "mgmt_transport.hpp"

namespace mgmt {

// ==========================================================================
// Доступ к свойствам через собственное подключение к локальной службе
// управления устройства. Закрытие транспорта закрывает подключение.
//
// Локальная служба не сообщает в описании свойства тип данных и уровни
// доступа: в описании PDT равен -1, уровни равны 0.
// ==========================================================================
class LocalTransport : public PropertyTransport, public LinkListener
{
  public:
    // Транспорт становится владельцем канала
    LocalTransport(Link*, TransportListener*, const std::string& = "");
    virtual ~LocalTransport();

    // Подключиться к локальной службе управления по адресу endpoint.
    // Если задан ключ, выполнить авторизацию, ошибка которой возвращается
    // в status вместе с открытым транспортом. NULL, если подключение не удалось.
    static LocalTransport* open(const std::string&, TransportListener*, const std::string&, Error&);

    virtual void close();

    virtual void link_closed(Link*);

  private:
    DISALLOW_COPY_AND_ASSIGN(LocalTransport);
    virtual Error request(KNXMGMT::PropertyRequest&, KNXMGMT::PropertyResponse&);

    Link *m_link;
};

} // namespace mgmt

#endif
