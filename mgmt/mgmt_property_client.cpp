#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

// Общесистемные заголовочные файлы
#include <exception>

// Служебные заголовочные файлы сторонних утилит
#include "glog/logging.h"

// Служебные файлы KNXMGMT
#include "helper.hpp"
#include "dpt_registry.hpp"
#include "mgmt_common.hpp"
#include "mgmt_property_client.hpp"

using namespace mgmt;

typedef struct {
  int code;
  const char* name;
} object_type_name_t;

static const object_type_name_t g_object_type_names[] = {
  { OT_DEVICE,                      "Device Object" },
  { OT_ADDRESS_TABLE,               "Addresstable Object" },
  { OT_ASSOCIATION_TABLE,           "Associationtable Object" },
  { OT_APPLICATION_PROGRAM,         "Applicationprogram Object" },
  { OT_INTERFACE_PROGRAM,           "Interfaceprogram Object" },
  { OT_KNX_OBJECT_ASSOCIATION_TABLE,"KNX-Object Associationtable Object" },
  { OT_ROUTER,                      "Router Object" },
  { OT_LTE_ADDRESS_ROUTING_TABLE,   "LTE Address Routing Table Object" },
  { OT_CEMI_SERVER,                 "cEMI Server Object" },
  { OT_GROUP_OBJECT_TABLE,          "Group Object Table Object" },
  { OT_POLLING_MASTER,              "Polling Master" },
  { OT_KNXNETIP_PARAMETER,          "KNXnet/IP Parameter Object" },
  { OT_RESERVED,                    "Reserved" },
  { OT_FILE_SERVER,                 "File Server Object" },
  { OT_SECURITY,                    "Security Object" },
  { OT_RF_MEDIUM,                   "RF Medium Object" },
  { -1,                             NULL }
};

// ==========================================================================
PropertyClient::PropertyClient(PropertyTransport* _transport)
  : m_transport(_transport),
    m_definitions(),
    m_object_types(),
    m_count_object_index(DEFAULT_OBJECT_COUNT_INDEX),
    m_count_pid(DEFAULT_OBJECT_COUNT_PID)
{
}

// ==========================================================================
PropertyClient::~PropertyClient()
{
  delete m_transport;
}

// ==========================================================================
Error PropertyClient::configure(const ClientConfig& config)
{
  Error status;

  m_transport->set_timeout(config.timeout());
  set_object_count_source(config.count_object_index(), config.count_pid());

  if (!config.definitions_filename().empty())
  {
    Definitions loaded;
    status = load_definitions(config.definitions_filename(), loaded);
    if (status.Ok())
      add_definitions(loaded);
  }

  return status;
}

// ==========================================================================
void PropertyClient::add_definitions(const Definitions& definitions)
{
  for (Definitions::const_iterator it = definitions.begin(); it != definitions.end(); ++it)
    m_definitions[it->first] = it->second;
}

// ==========================================================================
const PropertyDefinition* PropertyClient::find_definition(int object_type, int pid) const
{
  Definitions::const_iterator it = m_definitions.find(PropertyKey(object_type, pid));

  if (it == m_definitions.end())
    it = m_definitions.find(PropertyKey(OBJECT_TYPE_GLOBAL, pid));

  return (it != m_definitions.end())? &it->second : NULL;
}

// ==========================================================================
bool PropertyClient::has_specific_definition(int pid) const
{
  for (Definitions::const_iterator it = m_definitions.begin(); it != m_definitions.end(); ++it)
  {
    if ((it->first.pid == pid) && (it->first.object_type != OBJECT_TYPE_GLOBAL))
      return true;
  }
  return false;
}

// ==========================================================================
void PropertyClient::set_object_count_source(int object_index, int pid)
{
  m_count_object_index = object_index;
  m_count_pid = pid;
}

// ==========================================================================
Error PropertyClient::get_object_type(int object_index, int& object_type)
{
  std::map<int, int>::const_iterator it = m_object_types.find(object_index);
  std::string data;
  Error status;

  if (!m_transport->is_open())
    return Error(rtE_ILLEGAL_STATE, m_transport->name() + " is closed");

  if (it != m_object_types.end())
  {
    object_type = it->second;
    return status;
  }

  status = m_transport->get_property(object_index, PID_OBJECT_TYPE, 1, 1, data);
  if (status.NOk())
    return status;

  if (data.size() < 2)
    return Error(rtE_FORMAT, "object type " + hex_dump(data));

  object_type = static_cast<int>(get_unsigned_be(data, 0, 2));
  m_object_types[object_index] = object_type;
  return status;
}

// ==========================================================================
// Поиск DPT: определение для типа объекта, затем глобальное определение,
// затем тип по умолчанию для PDT из определения.
Error PropertyClient::resolve_dpt(int object_index, int pid, std::string& dpt)
{
  const PropertyDefinition* def = NULL;
  int object_type = OBJECT_TYPE_GLOBAL;

  // Тип объекта нужен, только если для этого PID есть частные определения
  if (has_specific_definition(pid))
  {
    Error status = get_object_type(object_index, object_type);
    if (status.code() == rtE_ILLEGAL_STATE)
      return status;
    if (status.NOk())
    {
      LOG(WARNING) << "Object " << object_index << ": " << status << ", use global definition of PID " << pid;
      object_type = OBJECT_TYPE_GLOBAL;
    }
  }

  def = find_definition(object_type, pid);
  if (!def)
    return Error(rtE_UNKNOWN_TYPE, "no definition for PID " + std::to_string(pid));

  dpt = def->dpt.empty()? dpt_by_pdt(def->pdt) : def->dpt;
  if (dpt.empty())
    return Error(rtE_UNKNOWN_TYPE, "no DPT for PID " + std::to_string(pid));

  return Error();
}

// ==========================================================================
Error PropertyClient::get_property(int object_index, int pid, std::string& value)
{
  dpt::Translator* translator = NULL;
  Error status = get_property_translated(object_index, pid, 1, 1, translator);

  if (status.Ok())
  {
    value = translator->value();
    delete translator;
  }

  return status;
}

// ==========================================================================
Error PropertyClient::get_property(int object_index, int pid, int start, int count, std::string& data)
{
  return m_transport->get_property(object_index, pid, start, count, data);
}

// ==========================================================================
Error PropertyClient::get_property_translated(int object_index, int pid, int start, int count,
                                              dpt::Translator*& translator)
{
  std::string data;
  std::string dpt;

  translator = NULL;

  if (!m_transport->is_open())
    return Error(rtE_ILLEGAL_STATE, m_transport->name() + " is closed");

  // Тип значения определяется до обращения к устройству
  Error status = resolve_dpt(object_index, pid, dpt);
  if (status.NOk())
    return status;

  dpt::Translator* result = dpt::TranslatorRegistry::create(dpt, status);
  if (!result)
    return status;

  status = m_transport->get_property(object_index, pid, start, count, data);
  if (status.Ok())
    status = result->set_data(data);

  if (status.NOk())
  {
    delete result;
    return status;
  }

  translator = result;
  return status;
}

// ==========================================================================
Error PropertyClient::set_property(int object_index, int pid, int start, int count, const std::string& data)
{
  return m_transport->set_property(object_index, pid, start, count, data);
}

// ==========================================================================
Error PropertyClient::set_property(int object_index, int pid, int start, const std::string& value)
{
  std::string dpt;

  if (!m_transport->is_open())
    return Error(rtE_ILLEGAL_STATE, m_transport->name() + " is closed");

  Error status = resolve_dpt(object_index, pid, dpt);
  if (status.NOk())
    return status;

  dpt::Translator* translator = dpt::TranslatorRegistry::create(dpt, status);
  if (!translator)
    return status;

  status = translator->set_value(value);
  if (status.Ok())
    status = m_transport->set_property(object_index, pid, start,
                                       static_cast<int>(translator->items()), translator->data());

  delete translator;
  return status;
}

// ==========================================================================
Error PropertyClient::get_description(int object_index, int pid, Description& description)
{
  return m_transport->get_description(object_index, pid, description);
}

// ==========================================================================
Error PropertyClient::get_description_by_index(int object_index, int property_index, Description& description)
{
  return m_transport->get_description_by_index(object_index, property_index, description);
}

// ==========================================================================
Error PropertyClient::scan_properties(bool authorized, const DescriptionConsumer& consumer)
{
  int objects = 0;
  bool exists = false;

  Error status = prepare_scan(authorized);
  if (status.NOk())
    return status;

  status = object_count(objects);
  if (status.NOk())
    return status;

  if (objects >= 0)
  {
    LOG(INFO) << "Scan " << objects << " interface objects";
    for (int object_index = 0; object_index < objects; object_index++)
    {
      status = scan_object(object_index, consumer, exists);
      if (status.NOk())
        return status;
    }
  }
  else
  {
    // Количество объектов неизвестно, перебираем до первого несуществующего
    for (int object_index = 0; object_index <= MAX_OBJECT_INDEX; object_index++)
    {
      status = scan_object(object_index, consumer, exists);
      if (status.NOk())
        return status;
      if (!exists)
        break;
    }
  }

  return status;
}

// ==========================================================================
Error PropertyClient::scan_properties(int object_index, bool authorized, const DescriptionConsumer& consumer)
{
  bool exists = false;

  Error status = prepare_scan(authorized);
  if (status.NOk())
    return status;

  return scan_object(object_index, consumer, exists);
}

// ==========================================================================
Error PropertyClient::prepare_scan(bool authorized)
{
  Error status;
  int level;

  if (!m_transport->is_open())
    return Error(rtE_ILLEGAL_STATE, m_transport->name() + " is closed");

  if (!authorized || !m_transport->has_key() || (m_transport->access_level() != ACCESS_LEVEL_FREE))
    return status;

  status = m_transport->authorize(m_transport->key(), level);
  switch(status.code())
  {
    case rtE_NONE:
      break;

    case rtE_TIMEOUT:
    case rtE_ACCESS_DENIED:
      LOG(WARNING) << m_transport->name() << ": authorization failed (" << status
                   << "), scan with access level " << m_transport->access_level();
      status.clear();
      break;

    default:
      LOG(ERROR) << m_transport->name() << ": authorization: " << status;
  }

  return status;
}

// ==========================================================================
// Количество объектов по количеству элементов свойства-источника.
// -1, если такого свойства у устройства нет.
Error PropertyClient::object_count(int& objects)
{
  std::string data;
  Error status = m_transport->get_property(m_count_object_index, m_count_pid, 0, 1, data);

  objects = -1;

  switch(status.code())
  {
    case rtE_NONE:
      if (data.size() < 2)
        return Error(rtE_FORMAT, "element count " + hex_dump(data));
      objects = static_cast<int>(get_unsigned_be(data, 0, 2));
      break;

    case rtE_NO_SUCH_PROPERTY:
    case rtE_ACCESS_DENIED:
      LOG(INFO) << "No object count in object " << m_count_object_index
                << " PID " << m_count_pid << " (" << status << "), probe objects";
      status.clear();
      break;

    default:
      break;
  }

  return status;
}

// ==========================================================================
Error PropertyClient::scan_object(int object_index, const DescriptionConsumer& consumer, bool& exists)
{
  Error status;

  exists = false;

  for (int index = 1; index <= MAX_PROPERTY_INDEX; index++)
  {
    Description description;

    status = m_transport->get_description_by_index(object_index, index, description);
    if (status.code() == rtE_NO_SUCH_PROPERTY)
    {
      // Свойств с большими индексами нет
      status.clear();
      break;
    }

    exists = true;

    if (status.code() == rtE_ACCESS_DENIED)
    {
      VLOG(1) << "Object " << object_index << " property index " << index << ": access denied";
      status.clear();
      continue;
    }

    if (status.NOk())
    {
      LOG(ERROR) << "Scan object " << object_index << " at property index " << index << ": " << status;
      return status;
    }

    deliver(consumer, description);
  }

  return status;
}

// ==========================================================================
void PropertyClient::deliver(const DescriptionConsumer& consumer, const Description& description)
{
  try
  {
    consumer(description);
  }
  catch(const std::exception& e)
  {
    LOG(ERROR) << "Consumer of " << description.dump() << ": " << e.what();
  }
  catch(...)
  {
    LOG(ERROR) << "Consumer of " << description.dump() << ": unknown exception";
  }
}

// ==========================================================================
void PropertyClient::close()
{
  m_transport->close();
}

// ==========================================================================
std::string PropertyClient::object_type_name(int code)
{
  for (const object_type_name_t* item = g_object_type_names; item->name; item++)
  {
    if (item->code == code)
      return item->name;
  }
  return "";
}

// ==========================================================================
std::string PropertyClient::dpt_by_pdt(int pdt)
{
  switch(pdt)
  {
    case PDT_UNSIGNED_CHAR: return "5.010";
    case PDT_UNSIGNED_INT:  return "7.001";
    case PDT_UNSIGNED_LONG: return "12.001";
    default:                return "";
  }
}
