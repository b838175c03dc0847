#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

// Общесистемные заголовочные файлы
#include <inttypes.h>
#include <stdio.h>
#include <stdlib.h>

// Служебные файлы KNXMGMT
#include "helper.hpp"
#include "dpt_translator_unsigned.hpp"

using namespace dpt;

const DPT TranslatorUnsigned::DPT_SCALING        = { "5.004",  "percent (8 bit)",  "0", "255", "%" };
const DPT TranslatorUnsigned::DPT_VALUE_1_UCOUNT = { "5.010",  "counter pulses",   "0", "255", "" };
const DPT TranslatorUnsigned::DPT_VALUE_2_UCOUNT = { "7.001",  "pulses",           "0", "65535", "pulses" };
const DPT TranslatorUnsigned::DPT_TIMEPERIOD     = { "7.002",  "time period in ms","0", "65535", "ms" };
const DPT TranslatorUnsigned::DPT_VALUE_4_UCOUNT = { "12.001", "counter pulses",   "0", "4294967295", "" };

// ==========================================================================
size_t TranslatorUnsigned::size_of(const DPT& _dpt)
{
  switch(atoi(_dpt.id))
  {
    case 5:  return 1;
    case 7:  return 2;
    case 12: return 4;
    default: return 0;
  }
}

// ==========================================================================
TranslatorUnsigned::TranslatorUnsigned(const DPT& _dpt)
  : Translator(_dpt, size_of(_dpt)),
    m_min(strtoull(_dpt.lower, NULL, 10)),
    m_max(strtoull(_dpt.upper, NULL, 10))
{
}

// ==========================================================================
TranslatorUnsigned::~TranslatorUnsigned()
{
}

// ==========================================================================
mgmt::Error TranslatorUnsigned::set_value(uint64_t _value)
{
  std::string buffer(m_type_size, '\0');
  mgmt::Error status = check_range(_value, std::to_string(_value));

  if (status.Ok())
  {
    put_unsigned_be(buffer, 0, m_type_size, _value);
    m_data.swap(buffer);
  }
  return status;
}

// ==========================================================================
uint64_t TranslatorUnsigned::value_unsigned(size_t _index) const
{
  if (_index >= items())
    return 0;

  return get_unsigned_be(m_data, _index * m_type_size, m_type_size);
}

// ==========================================================================
double TranslatorUnsigned::numeric_value() const
{
  return static_cast<double>(value_unsigned(0));
}

// ==========================================================================
mgmt::Error TranslatorUnsigned::to_dpt(const std::string& _text,
                                       std::string& _dst,
                                       size_t _index) const
{
  bool negative;
  uint64_t magnitude;

  if (!decode_number(_text, negative, magnitude))
    return mgmt::Error(mgmt::rtE_FORMAT, "wrong value format " + _text);

  // "-0" допустим
  if (negative && magnitude)
    return mgmt::Error(mgmt::rtE_FORMAT, "value " + _text + " out of range ["
                       + m_dpt.lower + ".." + m_dpt.upper + "]");

  mgmt::Error status = check_range(magnitude, _text);
  if (status.Ok())
    put_unsigned_be(_dst, _index * m_type_size, m_type_size, magnitude);

  return status;
}

// ==========================================================================
std::string TranslatorUnsigned::make_string(size_t _index) const
{
  char buffer[32];

  snprintf(buffer, sizeof(buffer), "%" PRIu64, value_unsigned(_index));
  return std::string(buffer);
}

// ==========================================================================
mgmt::Error TranslatorUnsigned::check_range(uint64_t _value, const std::string& _text) const
{
  if ((_value < m_min) || (m_max < _value))
    return mgmt::Error(mgmt::rtE_FORMAT, "value " + _text + " out of range ["
                       + m_dpt.lower + ".." + m_dpt.upper + "]");

  return mgmt::Error();
}
