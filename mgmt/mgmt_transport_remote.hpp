#pragma once
#ifndef MGMT_TRANSPORT_REMOTE_HPP
#define MGMT_TRANSPORT_REMOTE_HPP

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <string>

#include "mgmt_link.hpp"
#include "mgmt_transport.hpp"

namespace mgmt {

// ==========================================================================
// Доступ к свойствам удаленного устройства через разделяемый канал.
// Канал принадлежит вызывающей стороне и должен существовать дольше транспорта.
// Закрытие транспорта канал не закрывает.
// ==========================================================================
class RemoteTransport : public PropertyTransport, public LinkListener
{
  public:
    // connection_oriented - передавать устройству уведомления CONNECT и DISCONNECT
    RemoteTransport(Link*, int, TransportListener*, bool, const std::string& = "");
    virtual ~RemoteTransport();

    // Создать транспорт и, если задан ключ, выполнить авторизацию.
    // Ошибка авторизации возвращается в status вместе с открытым транспортом.
    // NULL, если канал закрыт.
    static RemoteTransport* create(Link*, int, TransportListener*, bool, const std::string&, Error&);

    int device_address() const { return m_device_address; };
    virtual void close();

    virtual void link_closed(Link*);

  private:
    DISALLOW_COPY_AND_ASSIGN(RemoteTransport);
    virtual Error request(KNXMGMT::PropertyRequest&, KNXMGMT::PropertyResponse&);

    Link *m_link;
    int   m_device_address;
    bool  m_connection_oriented;
};

} // namespace mgmt

#endif
