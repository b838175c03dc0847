#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "glog/logging.h"

#include "mgmt_common.hpp"
#include "mgmt_message.hpp"
#include "mgmt_transport_remote.hpp"

using namespace mgmt;

// ==========================================================================
RemoteTransport::RemoteTransport(Link* _link,
                                 int _device_address,
                                 TransportListener* _listener,
                                 bool _connection_oriented,
                                 const std::string& _key)
  : PropertyTransport("remote property transport " + address_to_string(_device_address), _listener, _key),
    m_link(_link),
    m_device_address(_device_address),
    m_connection_oriented(_connection_oriented)
{
  m_link->add_listener(this);

  if (!m_link->is_open())
  {
    // Открывать не на чем, уведомлять некого
    LOG(WARNING) << m_name << ": link " << m_link->name() << " is not open";
    m_link->remove_listener(this);
    mark_closed();
    return;
  }

  if (m_connection_oriented)
  {
    KNXMGMT::PropertyRequest notice;
    make_notice(notice, KNXMGMT::SVC_CONNECT);
    notice.set_destination(m_device_address);
    Error status = m_link->post(notice);
    if (status.NOk())
      LOG(ERROR) << m_name << ": connect: " << status;
  }

  LOG(INFO) << "Open " << m_name << " via " << m_link->name();
}

// ==========================================================================
RemoteTransport::~RemoteTransport()
{
  close();
}

// ==========================================================================
RemoteTransport* RemoteTransport::create(Link* link,
                                         int device_address,
                                         TransportListener* listener,
                                         bool connection_oriented,
                                         const std::string& key,
                                         Error& status)
{
  RemoteTransport* transport = NULL;
  int level;

  status.clear();

  if (!link || !link->is_open())
  {
    status.set(rtE_LINK, "link is not open");
    return NULL;
  }

  transport = new RemoteTransport(link, device_address, listener, connection_oriented, key);

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
Error RemoteTransport::request(KNXMGMT::PropertyRequest& req, KNXMGMT::PropertyResponse& resp)
{
  Error status = check_open();

  if (status.NOk())
    return status;

  req.set_destination(m_device_address);
  status = m_link->exchange(req, resp, m_timeout);

  // Транспорт мог быть закрыт во время ожидания ответа
  if (!is_open())
    return Error(rtE_ILLEGAL_STATE, m_name + " is closed");

  if (status.Ok())
    status = response_status(resp);

  return status;
}

// ==========================================================================
void RemoteTransport::close()
{
  if (!mark_closed())
    return;

  m_link->remove_listener(this);

  if (m_connection_oriented && m_link->is_open())
  {
    KNXMGMT::PropertyRequest notice;
    make_notice(notice, KNXMGMT::SVC_DISCONNECT);
    notice.set_destination(m_device_address);
    Error status = m_link->post(notice);
    if (status.NOk())
      LOG(WARNING) << m_name << ": disconnect: " << status;
  }

  notify_closed(CLOSED_BY_USER, "");
}

// ==========================================================================
void RemoteTransport::link_closed(Link* link)
{
  if (!mark_closed())
    return;

  link->remove_listener(this);
  notify_closed(CLOSED_BY_LINK, "link " + link->name() + " closed");
}
