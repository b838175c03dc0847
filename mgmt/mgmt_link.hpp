#pragma once
#ifndef MGMT_LINK_HPP
#define MGMT_LINK_HPP

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <string>

#include "proto/mgmt.pb.h"

#include "tool_listeners.hpp"
#include "mgmt_error.hpp"

namespace mgmt {

class Link;

// Получатель уведомления о закрытии канала
class LinkListener
{
  public:
    virtual ~LinkListener() {};
    virtual void link_closed(Link*) = 0;
};

// ==========================================================================
// Канал обмена запросами и ответами с устройством (шлюзом, локальной
// службой управления). Может разделяться несколькими транспортами.
// ==========================================================================
class Link
{
  public:
    Link(const std::string&);
    virtual ~Link();

    const std::string& name() const { return m_name; };

    virtual bool is_open() const = 0;
    // Передать запрос и дождаться ответа с тем же номером обмена.
    // Номер обмена назначается каналом.
    // rtE_TIMEOUT, если ответ не получен за timeout_msec.
    virtual Error exchange(KNXMGMT::PropertyRequest&, KNXMGMT::PropertyResponse&, int) = 0;
    // Передать уведомление, не требующее ответа
    virtual Error post(KNXMGMT::PropertyRequest&) = 0;
    // Закрыть канал. Подписчики уведомляются один раз.
    virtual void close() = 0;

    void add_listener(LinkListener*);
    void remove_listener(LinkListener*);

  protected:
    void fire_closed();

  private:
    DISALLOW_COPY_AND_ASSIGN(Link);
    std::string m_name;
    tool::ListenerRegistry<LinkListener> m_listeners;
};

} // namespace mgmt

#endif
