#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

// Общесистемные заголовочные файлы
#include <errno.h>
#include <libgen.h> // dirname
#include <stdio.h>
#include <string.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <vector>

// Служебные заголовочные файлы сторонних утилит
#include "glog/logging.h"
#include "rapidjson/error/en.h"
#include "rapidjson/filereadstream.h"

// Служебные файлы KNXMGMT
#include "helper.hpp"
#include "mgmt_common.hpp"
#include "mgmt_config.hpp"

using namespace rapidjson;
using namespace mgmt;

// ==========================================================================================
ClientConfig::ClientConfig(const std::string& config)
 : m_config_filename(config)
{
  set_defaults();
}

// ==========================================================================================
ClientConfig::~ClientConfig()
{
}

// ==========================================================================================
void ClientConfig::set_defaults()
{
  m_timeout = RESPONSE_TIMEOUT_MSEC;
  m_trace_level = 0;
  m_remote_endpoint.clear();
  m_device_address = -1;
  m_connection_oriented = false;
  m_key.clear();
  m_local_endpoint.clear();
  m_count_object_index = DEFAULT_OBJECT_COUNT_INDEX;
  m_count_pid = DEFAULT_OBJECT_COUNT_PID;
  m_definitions_filename.clear();
}

// ==========================================================================================
Error ClientConfig::load()
{
  const char* fname = "load";
  struct stat configfile_info;
  FILE* f_params = NULL;
  Document document;

  if (-1 == stat(m_config_filename.c_str(), &configfile_info)) {
    LOG(ERROR) << fname << ": Unable to stat() '" << m_config_filename << "': " << strerror(errno);
    return Error(rtE_CONFIG, m_config_filename + ": " + strerror(errno));
  }

  if (NULL == (f_params = fopen(m_config_filename.c_str(), "r"))) {
    LOG(ERROR) << fname << ": Locating config file " << m_config_filename
               << " (" << strerror(errno) << ")";
    return Error(rtE_CONFIG, m_config_filename + ": " + strerror(errno));
  }

  // Файл открылся успешно, прочитаем содержимое
  LOG(INFO) << fname << ": size of '" << m_config_filename << "' is " << configfile_info.st_size;
  std::vector<char> readBuffer(configfile_info.st_size + 4);
  FileReadStream is(f_params, &readBuffer[0], readBuffer.size());
  document.ParseStream(is);
  fclose(f_params);

  if (document.HasParseError()) {
    LOG(ERROR) << fname << ": Parsing " << m_config_filename << ": "
               << GetParseError_En(document.GetParseError());
    return Error(rtE_CONFIG, m_config_filename + ": " + GetParseError_En(document.GetParseError()));
  }

  Error status = apply(document);

  // Относительный путь к файлу определений берется от каталога конфигурации
  if (status.Ok() && !m_definitions_filename.empty() && (m_definitions_filename[0] != '/')) {
    std::vector<char> path(m_config_filename.begin(), m_config_filename.end());
    path.push_back('\0');
    m_definitions_filename = std::string(dirname(&path[0])) + "/" + m_definitions_filename;
  }

  return status;
}

// ==========================================================================================
Error ClientConfig::parse(const char* json)
{
  Document document;

  if (!json)
    return Error(rtE_CONFIG, "empty config");

  document.Parse(json);
  if (document.HasParseError()) {
    LOG(ERROR) << "Parsing config: " << GetParseError_En(document.GetParseError());
    return Error(rtE_CONFIG, GetParseError_En(document.GetParseError()));
  }

  return apply(document);
}

// ==========================================================================================
Error ClientConfig::apply(const Document& document)
{
  Error status;

  set_defaults();

  if (!document.IsObject())
    return Error(rtE_CONFIG, "config root is not an object");

  do {
    // Все разделы необязательны
    if (document.HasMember(s_COMMON)) {
      status = load_common(document[s_COMMON]);
      if (status.NOk()) break;
    }

    if (document.HasMember(s_REMOTE)) {
      status = load_remote(document[s_REMOTE]);
      if (status.NOk()) break;
    }

    if (document.HasMember(s_LOCAL)) {
      status = load_local(document[s_LOCAL]);
      if (status.NOk()) break;
    }

    if (document.HasMember(s_SCAN)) {
      status = load_scan(document[s_SCAN]);
      if (status.NOk()) break;
    }

    if (document.HasMember(s_DEFINITIONS)) {
      if (!document[s_DEFINITIONS].IsString()) {
        status.set(rtE_CONFIG, "'" s_DEFINITIONS "' is not a file name");
        break;
      }
      m_definitions_filename.assign(document[s_DEFINITIONS].GetString());
    }

  } while(false);

  if (status.NOk())
    LOG(ERROR) << "Config " << m_config_filename << ": " << status;

  return status;
}

// ==========================================================================================
Error ClientConfig::load_common(const Value& section)
{
  if (!section.IsObject())
    return Error(rtE_CONFIG, "section '" s_COMMON "' is not an object");

  if (section.HasMember(s_COMMON_TIMEOUT)) {
    if (!section[s_COMMON_TIMEOUT].IsInt() || (section[s_COMMON_TIMEOUT].GetInt() <= 0))
      return Error(rtE_CONFIG, s_COMMON ":" s_COMMON_TIMEOUT);
    m_timeout = section[s_COMMON_TIMEOUT].GetInt();
  }

  if (section.HasMember(s_COMMON_TRACE)) {
    if (!section[s_COMMON_TRACE].IsInt())
      return Error(rtE_CONFIG, s_COMMON ":" s_COMMON_TRACE);
    m_trace_level = section[s_COMMON_TRACE].GetInt();
  }

  LOG(INFO) << "Timeout " << m_timeout << " msec, trace level " << m_trace_level;
  return Error();
}

// ==========================================================================================
Error ClientConfig::load_remote(const Value& section)
{
  if (!section.IsObject())
    return Error(rtE_CONFIG, "section '" s_REMOTE "' is not an object");

  if (section.HasMember(s_REMOTE_ENDPOINT)) {
    if (!section[s_REMOTE_ENDPOINT].IsString())
      return Error(rtE_CONFIG, s_REMOTE ":" s_REMOTE_ENDPOINT);
    m_remote_endpoint.assign(section[s_REMOTE_ENDPOINT].GetString());
  }

  if (section.HasMember(s_REMOTE_DEVICE)) {
    const Value& device = section[s_REMOTE_DEVICE];
    if (device.IsString()) {
      if (!parse_individual_address(device.GetString(), m_device_address))
        return Error(rtE_CONFIG, std::string(s_REMOTE ":" s_REMOTE_DEVICE " ") + device.GetString());
    }
    else if (device.IsInt() && (0 <= device.GetInt()) && (device.GetInt() <= 0xFFFF)) {
      m_device_address = device.GetInt();
    }
    else
      return Error(rtE_CONFIG, s_REMOTE ":" s_REMOTE_DEVICE);
  }

  if (section.HasMember(s_REMOTE_CONNECTION_ORIENTED)) {
    const Value& mode = section[s_REMOTE_CONNECTION_ORIENTED];
    if (mode.IsBool())
      m_connection_oriented = mode.GetBool();
    else if (mode.IsInt())
      m_connection_oriented = (0 != mode.GetInt());
    else
      return Error(rtE_CONFIG, s_REMOTE ":" s_REMOTE_CONNECTION_ORIENTED);
  }

  if (section.HasMember(s_REMOTE_KEY)) {
    if (!section[s_REMOTE_KEY].IsString() || !hex_to_bytes(section[s_REMOTE_KEY].GetString(), m_key))
      return Error(rtE_CONFIG, s_REMOTE ":" s_REMOTE_KEY);
  }

  LOG(INFO) << "Remote device " << address_to_string(m_device_address)
            << " via '" << m_remote_endpoint << "'"
            << (m_connection_oriented? ", connection-oriented" : "")
            << (m_key.empty()? "" : ", with key");
  return Error();
}

// ==========================================================================================
Error ClientConfig::load_local(const Value& section)
{
  if (!section.IsObject())
    return Error(rtE_CONFIG, "section '" s_LOCAL "' is not an object");

  if (section.HasMember(s_LOCAL_ENDPOINT)) {
    if (!section[s_LOCAL_ENDPOINT].IsString())
      return Error(rtE_CONFIG, s_LOCAL ":" s_LOCAL_ENDPOINT);
    m_local_endpoint.assign(section[s_LOCAL_ENDPOINT].GetString());
  }

  return Error();
}

// ==========================================================================================
Error ClientConfig::load_scan(const Value& section)
{
  if (!section.IsObject())
    return Error(rtE_CONFIG, "section '" s_SCAN "' is not an object");

  if (section.HasMember(s_SCAN_OBJECT_INDEX)) {
    if (!section[s_SCAN_OBJECT_INDEX].IsInt()
     || (section[s_SCAN_OBJECT_INDEX].GetInt() < 0)
     || (section[s_SCAN_OBJECT_INDEX].GetInt() > MAX_OBJECT_INDEX))
      return Error(rtE_CONFIG, s_SCAN ":" s_SCAN_OBJECT_INDEX);
    m_count_object_index = section[s_SCAN_OBJECT_INDEX].GetInt();
  }

  if (section.HasMember(s_SCAN_PID)) {
    if (!section[s_SCAN_PID].IsInt() || (section[s_SCAN_PID].GetInt() <= 0))
      return Error(rtE_CONFIG, s_SCAN ":" s_SCAN_PID);
    m_count_pid = section[s_SCAN_PID].GetInt();
  }

  return Error();
}
