// ==========================================================================
//  Определения свойств: имена, тип данных и тип точки данных по умолчанию.
//  Загружаются из JSON-файла вида
//  { "properties": [
//      { "object_type": -1, "pid": 56, "name": "Max. APDU length",
//        "pid_name": "MAX_APDULENGTH", "pdt": 4, "dpt": "7.001", "read_only": true } ] }
// ==========================================================================
#pragma once
#ifndef MGMT_DEFINITIONS_HPP
#define MGMT_DEFINITIONS_HPP

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <map>
#include <string>

#include "mgmt_common.hpp"
#include "mgmt_error.hpp"

#define s_DEF_PROPERTIES   "properties"
#define s_DEF_OBJECT_TYPE  "object_type"  // -1 - для всех типов объектов
#define s_DEF_PID          "pid"
#define s_DEF_NAME         "name"
#define s_DEF_PID_NAME     "pid_name"
#define s_DEF_PDT          "pdt"
#define s_DEF_DPT          "dpt"
#define s_DEF_READ_ONLY    "read_only"

namespace mgmt {

typedef struct {
  int  object_type;
  int  pid;
  // Отображаемое название свойства
  std::string name;
  // Краткое символическое название, например "PROGRAM_VERSION"
  std::string pid_name;
  // Тип данных свойства, -1 если не задан
  int  pdt;
  // Тип точки данных по умолчанию, пустой если не задан
  std::string dpt;
  bool read_only;
} PropertyDefinition;

struct PropertyKey
{
  PropertyKey(int _object_type, int _pid) : object_type(_object_type), pid(_pid) {};

  bool operator<(const PropertyKey& _other) const
  {
    return (object_type < _other.object_type)
        || ((object_type == _other.object_type) && (pid < _other.pid));
  };

  int object_type;
  int pid;
};

typedef std::map<PropertyKey, PropertyDefinition> Definitions;

// Разобрать JSON-текст и добавить определения в definitions.
// Повторное определение того же свойства заменяет предыдущее.
Error parse_definitions(const char*, Definitions&);
// То же для содержимого файла
Error load_definitions(const std::string&, Definitions&);

} // namespace mgmt

#endif
