#pragma once
#ifndef MGMT_DESCRIPTION_HPP
#define MGMT_DESCRIPTION_HPP

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <string>

namespace mgmt {

// ==========================================================================
// Описание свойства интерфейсного объекта, полученное от устройства.
// Не изменяется после создания.
// ==========================================================================
class Description
{
  public:
    Description();
    Description(int object_type,
                int object_index,
                int pid,
                int property_index,
                int pdt,
                int current_elements,
                int max_elements,
                int read_level,
                int write_level,
                bool write_enabled);

    int  object_type() const      { return m_object_type; };
    int  object_index() const     { return m_object_index; };
    int  pid() const              { return m_pid; };
    int  property_index() const   { return m_property_index; };
    // -1, если тип данных неизвестен
    int  pdt() const              { return m_pdt; };
    int  current_elements() const { return m_current_elements; };
    int  max_elements() const     { return m_max_elements; };
    int  read_level() const       { return m_read_level; };
    int  write_level() const      { return m_write_level; };
    bool write_enabled() const    { return m_write_enabled; };

    bool operator==(const Description&) const;
    bool operator!=(const Description& _other) const { return !(*this == _other); };

    // Описание в одну строку
    std::string dump() const;

  private:
    int  m_object_type;
    int  m_object_index;
    int  m_pid;
    int  m_property_index;
    int  m_pdt;
    int  m_current_elements;
    int  m_max_elements;
    int  m_read_level;
    int  m_write_level;
    bool m_write_enabled;
};

} // namespace mgmt

#endif
