#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <sstream>

#include "mgmt_description.hpp"

using namespace mgmt;

Description::Description()
  : m_object_type(-1),
    m_object_index(-1),
    m_pid(-1),
    m_property_index(-1),
    m_pdt(-1),
    m_current_elements(0),
    m_max_elements(0),
    m_read_level(0),
    m_write_level(0),
    m_write_enabled(false)
{
}

Description::Description(int _object_type,
                         int _object_index,
                         int _pid,
                         int _property_index,
                         int _pdt,
                         int _current_elements,
                         int _max_elements,
                         int _read_level,
                         int _write_level,
                         bool _write_enabled)
  : m_object_type(_object_type),
    m_object_index(_object_index),
    m_pid(_pid),
    m_property_index(_property_index),
    m_pdt(_pdt),
    m_current_elements(_current_elements),
    m_max_elements(_max_elements),
    m_read_level(_read_level),
    m_write_level(_write_level),
    m_write_enabled(_write_enabled)
{
}

bool Description::operator==(const Description& _other) const
{
  return (m_object_type == _other.m_object_type)
      && (m_object_index == _other.m_object_index)
      && (m_pid == _other.m_pid)
      && (m_property_index == _other.m_property_index)
      && (m_pdt == _other.m_pdt)
      && (m_current_elements == _other.m_current_elements)
      && (m_max_elements == _other.m_max_elements)
      && (m_read_level == _other.m_read_level)
      && (m_write_level == _other.m_write_level)
      && (m_write_enabled == _other.m_write_enabled);
}

std::string Description::dump() const
{
  std::ostringstream out;

  out << "OT=" << m_object_type
      << ", OI=" << m_object_index
      << ", PID=" << m_pid
      << ", P index=" << m_property_index
      << ", PDT=" << m_pdt
      << ", curr elems=" << m_current_elements
      << ", max elems=" << m_max_elements
      << ", r-lvl=" << m_read_level
      << ", w-lvl=" << m_write_level
      << ", writeenable=" << (m_write_enabled? "true" : "false");

  return out.str();
}
