#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <exception>

#include "glog/logging.h"

#include "helper.hpp"
#include "mgmt_common.hpp"
#include "mgmt_message.hpp"
#include "mgmt_transport.hpp"

using namespace mgmt;

PropertyTransport::PropertyTransport(const std::string& _name,
                                     TransportListener* _listener,
                                     const std::string& _key)
  : m_name(_name),
    m_listener(_listener),
    m_key(_key),
    m_access_level(ACCESS_LEVEL_FREE),
    m_timeout(RESPONSE_TIMEOUT_MSEC),
    m_open(true)
{
}

PropertyTransport::~PropertyTransport()
{
}

bool PropertyTransport::mark_closed()
{
  bool expected = true;
  return m_open.compare_exchange_strong(expected, false);
}

void PropertyTransport::notify_closed(close_initiator_t initiator, const std::string& reason)
{
  LOG(INFO) << m_name << " closed"
            << ((CLOSED_BY_USER == initiator)? " by user" : " by link")
            << (reason.empty()? "" : ": ") << reason;

  if (!m_listener)
    return;

  try
  {
    m_listener->transport_closed(CloseEvent(this, initiator, reason));
  }
  catch(const std::exception& e)
  {
    LOG(ERROR) << m_name << ": close listener failed: " << e.what();
  }
  catch(...)
  {
    LOG(ERROR) << m_name << ": close listener failed: unknown exception";
  }
}

Error PropertyTransport::check_open() const
{
  if (!m_open)
    return Error(rtE_ILLEGAL_STATE, m_name + " is closed");

  return Error();
}

// ==========================================================================
Error PropertyTransport::get_property(int object_index, int pid, int start, int count, std::string& data)
{
  KNXMGMT::PropertyRequest req;
  KNXMGMT::PropertyResponse resp;

  make_property_read(req, object_index, pid, start, count);
  Error status = request(req, resp);
  if (status.Ok())
    data = resp.data();

  return status;
}

// ==========================================================================
Error PropertyTransport::set_property(int object_index, int pid, int start, int count,
                                      const std::string& data)
{
  KNXMGMT::PropertyRequest req;
  KNXMGMT::PropertyResponse resp;

  make_property_write(req, object_index, pid, start, count, data);
  return request(req, resp);
}

// ==========================================================================
Error PropertyTransport::get_description(int object_index, int pid, Description& description)
{
  KNXMGMT::PropertyRequest req;

  make_description_read(req, object_index, pid);
  return read_description(req, description);
}

// ==========================================================================
Error PropertyTransport::get_description_by_index(int object_index, int property_index,
                                                  Description& description)
{
  KNXMGMT::PropertyRequest req;

  make_description_read_by_index(req, object_index, property_index);
  return read_description(req, description);
}

// ==========================================================================
Error PropertyTransport::authorize(const std::string& key, int& level)
{
  KNXMGMT::PropertyRequest req;
  KNXMGMT::PropertyResponse resp;

  make_authorize(req, key);
  Error status = request(req, resp);
  if (status.Ok())
  {
    level = resp.access_level();
    m_access_level = level;
    LOG(INFO) << m_name << ": access level " << level;
  }

  return status;
}

// ==========================================================================
Error PropertyTransport::read_description(KNXMGMT::PropertyRequest& req, Description& description)
{
  KNXMGMT::PropertyResponse resp;
  Error status = request(req, resp);

  if (status.NOk())
    return status;

  if (!resp.has_description())
    return Error(rtE_REMOTE, "no description in response");

  return complete_description(resp.description(), description);
}

// ==========================================================================
Error PropertyTransport::complete_description(const KNXMGMT::PropertyDescription& pb,
                                              Description& description)
{
  const Description received = to_description(pb);
  int object_type = received.object_type();
  int current_elements = received.current_elements();
  std::string data;

  if (!pb.has_object_type())
  {
    if (get_property(pb.object_index(), PID_OBJECT_TYPE, 1, 1, data).Ok() && (data.size() >= 2))
      object_type = static_cast<int>(get_unsigned_be(data, 0, 2));
    else
      VLOG(1) << m_name << ": no object type for object " << pb.object_index();
  }

  if (!pb.has_current_elements())
  {
    // Элемент 0 - текущее количество элементов
    if (get_property(pb.object_index(), pb.pid(), 0, 1, data).Ok() && (data.size() >= 2))
      current_elements = static_cast<int>(get_unsigned_be(data, 0, 2));
  }

  // Транспорт мог быть закрыт во время дополнительных запросов
  Error status = check_open();
  if (status.NOk())
    return status;

  description = Description(object_type,
                            received.object_index(),
                            received.pid(),
                            received.property_index(),
                            received.pdt(),
                            current_elements,
                            received.max_elements(),
                            received.read_level(),
                            received.write_level(),
                            received.write_enabled());
  return status;
}
