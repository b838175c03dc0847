#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "mgmt_message.hpp"

// --------------------------------------------------------------------------
void mgmt::make_property_read(KNXMGMT::PropertyRequest& request,
                              int object_index, int pid, int start, int count)
{
  request.Clear();
  request.set_exchange_id(0);
  request.set_service(KNXMGMT::SVC_PROPERTY_READ);
  request.set_object_index(object_index);
  request.set_pid(pid);
  request.set_start(start);
  request.set_count(count);
}

// --------------------------------------------------------------------------
void mgmt::make_property_write(KNXMGMT::PropertyRequest& request,
                               int object_index, int pid, int start, int count,
                               const std::string& data)
{
  request.Clear();
  request.set_exchange_id(0);
  request.set_service(KNXMGMT::SVC_PROPERTY_WRITE);
  request.set_object_index(object_index);
  request.set_pid(pid);
  request.set_start(start);
  request.set_count(count);
  request.set_data(data);
}

// --------------------------------------------------------------------------
void mgmt::make_description_read(KNXMGMT::PropertyRequest& request, int object_index, int pid)
{
  request.Clear();
  request.set_exchange_id(0);
  request.set_service(KNXMGMT::SVC_DESCRIPTION_READ);
  request.set_object_index(object_index);
  request.set_pid(pid);
}

// --------------------------------------------------------------------------
void mgmt::make_description_read_by_index(KNXMGMT::PropertyRequest& request,
                                          int object_index, int property_index)
{
  request.Clear();
  request.set_exchange_id(0);
  request.set_service(KNXMGMT::SVC_DESCRIPTION_READ_BY_INDEX);
  request.set_object_index(object_index);
  request.set_property_index(property_index);
}

// --------------------------------------------------------------------------
void mgmt::make_authorize(KNXMGMT::PropertyRequest& request, const std::string& key)
{
  request.Clear();
  request.set_exchange_id(0);
  request.set_service(KNXMGMT::SVC_AUTHORIZE);
  request.set_key(key);
}

// --------------------------------------------------------------------------
void mgmt::make_notice(KNXMGMT::PropertyRequest& request, KNXMGMT::ServiceCode service)
{
  request.Clear();
  request.set_exchange_id(0);
  request.set_service(service);
}

// --------------------------------------------------------------------------
mgmt::Error mgmt::response_status(const KNXMGMT::PropertyResponse& response)
{
  switch(response.status())
  {
    case KNXMGMT::RS_OK:
      return Error();

    case KNXMGMT::RS_NO_SUCH_PROPERTY:
      return Error(rtE_NO_SUCH_PROPERTY);

    case KNXMGMT::RS_ACCESS_DENIED:
      return Error(rtE_ACCESS_DENIED);

    case KNXMGMT::RS_ILLEGAL_PARAMETER:
      return Error(rtE_ILLEGAL_PARAMETER_VALUE);

    case KNXMGMT::RS_UNSUPPORTED:
      return Error(rtE_NOT_SUPPORTED, service_name(response.service()));

    case KNXMGMT::RS_FAILURE:
      return Error(rtE_REMOTE);
  }

  return Error(rtE_UNKNOWN, "response status " + std::to_string(response.status()));
}

// --------------------------------------------------------------------------
mgmt::Description mgmt::to_description(const KNXMGMT::PropertyDescription& pb)
{
  return Description(pb.has_object_type()? static_cast<int>(pb.object_type()) : -1,
                     pb.object_index(),
                     pb.pid(),
                     pb.property_index(),
                     pb.has_pdt()? static_cast<int>(pb.pdt()) : -1,
                     pb.current_elements(),
                     pb.max_elements(),
                     pb.read_level(),
                     pb.write_level(),
                     pb.write_enabled());
}

// --------------------------------------------------------------------------
const char* mgmt::service_name(int service)
{
  switch(service)
  {
    case KNXMGMT::SVC_PROPERTY_READ:             return "PROPERTY_READ";
    case KNXMGMT::SVC_PROPERTY_WRITE:            return "PROPERTY_WRITE";
    case KNXMGMT::SVC_DESCRIPTION_READ:          return "DESCRIPTION_READ";
    case KNXMGMT::SVC_DESCRIPTION_READ_BY_INDEX: return "DESCRIPTION_READ_BY_INDEX";
    case KNXMGMT::SVC_AUTHORIZE:                 return "AUTHORIZE";
    case KNXMGMT::SVC_CONNECT:                   return "CONNECT";
    case KNXMGMT::SVC_DISCONNECT:                return "DISCONNECT";
    default:                                     return "UNKNOWN";
  }
}
