#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

// Общесистемные заголовочные файлы
#include <inttypes.h>
#include <stdio.h>
#include <stdlib.h>

// Служебные файлы KNXMGMT
#include "helper.hpp"
#include "dpt_translator_64bit_signed.hpp"

using namespace dpt;

#define V64_SIZE  8

const DPT Translator64BitSigned::DPT_ACTIVE_ENERGY = {
  "29.010", "active energy", "-9223372036854775808", "9223372036854775807", "Wh"
};
const DPT Translator64BitSigned::DPT_APPARENT_ENERGY = {
  "29.011", "apparent energy", "-9223372036854775808", "9223372036854775807", "VAh"
};
const DPT Translator64BitSigned::DPT_REACTIVE_ENERGY = {
  "29.012", "reactive energy", "-9223372036854775808", "9223372036854775807", "VARh"
};

// ==========================================================================
Translator64BitSigned::Translator64BitSigned(const DPT& _dpt)
  : Translator(_dpt, V64_SIZE),
    m_min(strtoll(_dpt.lower, NULL, 10)),
    m_max(strtoll(_dpt.upper, NULL, 10))
{
}

// ==========================================================================
Translator64BitSigned::~Translator64BitSigned()
{
}

// ==========================================================================
mgmt::Error Translator64BitSigned::set_value(int64_t _value)
{
  std::string buffer(V64_SIZE, '\0');
  mgmt::Error status = check_range(_value, std::to_string(_value));

  if (status.Ok())
  {
    put_unsigned_be(buffer, 0, V64_SIZE, static_cast<uint64_t>(_value));
    m_data.swap(buffer);
  }
  return status;
}

// ==========================================================================
int64_t Translator64BitSigned::value_signed(size_t _index) const
{
  if (_index >= items())
    return 0;

  return static_cast<int64_t>(get_unsigned_be(m_data, _index * V64_SIZE, V64_SIZE));
}

// ==========================================================================
double Translator64BitSigned::numeric_value() const
{
  return static_cast<double>(value_signed(0));
}

// ==========================================================================
mgmt::Error Translator64BitSigned::to_dpt(const std::string& _text,
                                          std::string& _dst,
                                          size_t _index) const
{
  bool negative;
  uint64_t magnitude;
  int64_t value;

  if (!decode_number(_text, negative, magnitude))
    return mgmt::Error(mgmt::rtE_FORMAT, "wrong value format " + _text);

  if (negative)
  {
    // |INT64_MIN| = INT64_MAX + 1
    if (magnitude > static_cast<uint64_t>(INT64_MAX) + 1)
      return mgmt::Error(mgmt::rtE_FORMAT, "value " + _text + " out of range");
    value = (magnitude == static_cast<uint64_t>(INT64_MAX) + 1)?
             INT64_MIN : -static_cast<int64_t>(magnitude);
  }
  else
  {
    if (magnitude > static_cast<uint64_t>(INT64_MAX))
      return mgmt::Error(mgmt::rtE_FORMAT, "value " + _text + " out of range");
    value = static_cast<int64_t>(magnitude);
  }

  mgmt::Error status = check_range(value, _text);
  if (status.Ok())
    put_unsigned_be(_dst, _index * V64_SIZE, V64_SIZE, static_cast<uint64_t>(value));

  return status;
}

// ==========================================================================
std::string Translator64BitSigned::make_string(size_t _index) const
{
  char buffer[32];

  snprintf(buffer, sizeof(buffer), "%" PRId64, value_signed(_index));
  return std::string(buffer);
}

// ==========================================================================
mgmt::Error Translator64BitSigned::check_range(int64_t _value, const std::string& _text) const
{
  if ((_value < m_min) || (m_max < _value))
    return mgmt::Error(mgmt::rtE_FORMAT, "value " + _text + " out of range ["
                       + m_dpt.lower + ".." + m_dpt.upper + "]");

  return mgmt::Error();
}
