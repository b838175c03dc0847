#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

// Общесистемные заголовочные файлы
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <vector>

// Служебные заголовочные файлы сторонних утилит
#include "glog/logging.h"
#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/filereadstream.h"

// Служебные файлы KNXMGMT
#include "mgmt_definitions.hpp"

using namespace rapidjson;

namespace {

// --------------------------------------------------------------------------
mgmt::Error collect(const Document& document, mgmt::Definitions& definitions)
{
  mgmt::Definitions loaded;

  if (!document.IsObject() || !document.HasMember(s_DEF_PROPERTIES)
   || !document[s_DEF_PROPERTIES].IsArray())
  {
    return mgmt::Error(mgmt::rtE_CONFIG, "missing '" s_DEF_PROPERTIES "' array");
  }

  const Value& properties = document[s_DEF_PROPERTIES];
  for (Value::ConstValueIterator itr = properties.Begin(); itr != properties.End(); ++itr)
  {
    const size_t position = itr - properties.Begin();
    mgmt::PropertyDefinition def = { OBJECT_TYPE_GLOBAL, 0, "", "", mgmt::PDT_UNKNOWN, "", false };

    if (!itr->IsObject() || !itr->HasMember(s_DEF_PID) || !(*itr)[s_DEF_PID].IsInt())
      return mgmt::Error(mgmt::rtE_CONFIG, "item " + std::to_string(position) + ": missing '" s_DEF_PID "'");

    const Value& item = *itr;
    def.pid = item[s_DEF_PID].GetInt();

    if (item.HasMember(s_DEF_OBJECT_TYPE))
    {
      if (!item[s_DEF_OBJECT_TYPE].IsInt())
        return mgmt::Error(mgmt::rtE_CONFIG, "item " + std::to_string(position) + ": bad '" s_DEF_OBJECT_TYPE "'");
      def.object_type = item[s_DEF_OBJECT_TYPE].GetInt();
    }

    if (item.HasMember(s_DEF_NAME) && item[s_DEF_NAME].IsString())
      def.name.assign(item[s_DEF_NAME].GetString());

    if (item.HasMember(s_DEF_PID_NAME) && item[s_DEF_PID_NAME].IsString())
      def.pid_name.assign(item[s_DEF_PID_NAME].GetString());

    if (item.HasMember(s_DEF_PDT))
    {
      if (!item[s_DEF_PDT].IsInt())
        return mgmt::Error(mgmt::rtE_CONFIG, "item " + std::to_string(position) + ": bad '" s_DEF_PDT "'");
      def.pdt = item[s_DEF_PDT].GetInt();
    }

    if (item.HasMember(s_DEF_DPT))
    {
      if (!item[s_DEF_DPT].IsString())
        return mgmt::Error(mgmt::rtE_CONFIG, "item " + std::to_string(position) + ": bad '" s_DEF_DPT "'");
      def.dpt.assign(item[s_DEF_DPT].GetString());
    }

    if (item.HasMember(s_DEF_READ_ONLY))
    {
      if (item[s_DEF_READ_ONLY].IsBool())
        def.read_only = item[s_DEF_READ_ONLY].GetBool();
      else if (item[s_DEF_READ_ONLY].IsInt())
        def.read_only = (0 != item[s_DEF_READ_ONLY].GetInt());
      else
        return mgmt::Error(mgmt::rtE_CONFIG, "item " + std::to_string(position) + ": bad '" s_DEF_READ_ONLY "'");
    }

    loaded[mgmt::PropertyKey(def.object_type, def.pid)] = def;
  }

  // Документ разобран целиком, только теперь изменяем результат
  for (mgmt::Definitions::const_iterator it = loaded.begin(); it != loaded.end(); ++it)
    definitions[it->first] = it->second;

  LOG(INFO) << "Loaded " << loaded.size() << " property definitions";
  return mgmt::Error();
}

} // namespace

// --------------------------------------------------------------------------
mgmt::Error mgmt::parse_definitions(const char* json, Definitions& definitions)
{
  Document document;

  if (!json)
    return Error(rtE_CONFIG, "empty definitions");

  document.Parse(json);
  if (document.HasParseError())
  {
    LOG(ERROR) << "Parsing definitions at offset " << document.GetErrorOffset()
               << ": " << GetParseError_En(document.GetParseError());
    return Error(rtE_CONFIG, GetParseError_En(document.GetParseError()));
  }

  return collect(document, definitions);
}

// --------------------------------------------------------------------------
mgmt::Error mgmt::load_definitions(const std::string& filename, Definitions& definitions)
{
  const char* fname = "load_definitions";
  struct stat file_info;
  FILE* file = NULL;
  Document document;

  if (-1 == stat(filename.c_str(), &file_info))
  {
    LOG(ERROR) << fname << ": Unable to stat() '" << filename << "': " << strerror(errno);
    return Error(rtE_CONFIG, filename + ": " + strerror(errno));
  }

  if (NULL == (file = fopen(filename.c_str(), "r")))
  {
    LOG(ERROR) << fname << ": Unable to open '" << filename << "': " << strerror(errno);
    return Error(rtE_CONFIG, filename + ": " + strerror(errno));
  }

  // Размер буфера чтения не меньше 4 байт
  std::vector<char> buffer(file_info.st_size + 4);
  FileReadStream is(file, &buffer[0], buffer.size());
  document.ParseStream(is);
  fclose(file);

  if (document.HasParseError())
  {
    LOG(ERROR) << fname << ": Parsing " << filename << " at offset " << document.GetErrorOffset()
               << ": " << GetParseError_En(document.GetParseError());
    return Error(rtE_CONFIG, filename + ": " + GetParseError_En(document.GetParseError()));
  }

  return collect(document, definitions);
}
