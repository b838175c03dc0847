#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "glog/logging.h"

#include "mgmt_common.hpp"
#include "mgmt_message.hpp"
#include "mgmt_link_zmq.hpp"
#include "mgmt_transport_local.hpp"

using namespace mgmt;

// ==========================================================================
LocalTransport::LocalTransport(Link* _link, TransportListener* _listener, const std::string& _key)
  : PropertyTransport("local property transport " + _link->name(), _listener, _key),
    m_link(_link)
{
  if (!m_link->is_open())
  {
    LOG(WARNING) << m_name << ": link is not open";
    mark_closed();
    return;
  }

  m_link->add_listener(this);
  LOG(INFO) << "Open " << m_name;
}

// ==========================================================================
LocalTransport::~LocalTransport()
{
  close();
  delete m_link;
}

// ==========================================================================
LocalTransport* LocalTransport::open(const std::string& endpoint,
                                     TransportListener* listener,
                                     const std::string& key,
                                     Error& status)
{
  LocalTransport* transport = NULL;
  ZmqLink* link = new ZmqLink(endpoint);
  int level;

  status = link->open();
  if (status.NOk())
  {
    LOG(ERROR) << "Local management connection to " << endpoint << ": " << status;
    delete link;
    return NULL;
  }

  transport = new LocalTransport(link, listener, key);

  if (transport->has_key())
  {
    status = transport->authorize(key, level);
    if (status.NOk())
      LOG(WARNING) << transport->name() << ": authorization failed, continue with access level "
                   << transport->access_level() << " (" << status << ")";
  }

  return transport;
}

// ==========================================================================
Error LocalTransport::request(KNXMGMT::PropertyRequest& req, KNXMGMT::PropertyResponse& resp)
{
  Error status = check_open();

  if (status.NOk())
    return status;

  status = m_link->exchange(req, resp, m_timeout);

  if (!is_open())
    return Error(rtE_ILLEGAL_STATE, m_name + " is closed");

  if (status.Ok())
    status = response_status(resp);

  return status;
}

// ==========================================================================
void LocalTransport::close()
{
  if (!mark_closed())
    return;

  // Отписаться до закрытия, чтобы не получить уведомление о собственном закрытии
  m_link->remove_listener(this);
  m_link->close();

  notify_closed(CLOSED_BY_USER, "");
}

// ==========================================================================
void LocalTransport::link_closed(Link* link)
{
  if (!mark_closed())
    return;

  link->remove_listener(this);
  notify_closed(CLOSED_BY_LINK, "link " + link->name() + " closed");
}
