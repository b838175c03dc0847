#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

// Общесистемные заголовочные файлы
#include <ctype.h>
#include <string.h>

// Служебные заголовочные файлы сторонних утилит
#include "glog/logging.h"

// Служебные файлы KNXMGMT
#include "helper.hpp"
#include "dpt_translator.hpp"

using namespace dpt;

// ==========================================================================
Translator::Translator(const DPT& _dpt, size_t _type_size)
  : m_dpt(_dpt),
    m_type_size(_type_size),
    m_data(_type_size, '\0'),
    m_append_unit(true)
{
}

// ==========================================================================
Translator::~Translator()
{
}

// ==========================================================================
mgmt::Error Translator::set_value(const std::string& _value)
{
  std::string buffer(m_type_size, '\0');
  mgmt::Error status = to_dpt(remove_unit(_value), buffer, 0);

  if (status.Ok())
    m_data.swap(buffer);
  else
    VLOG(1) << m_dpt.id << ": " << status;

  return status;
}

// ==========================================================================
mgmt::Error Translator::set_values(const std::vector<std::string>& _values)
{
  mgmt::Error status;

  if (_values.empty())
    return mgmt::Error(mgmt::rtE_FORMAT, "no values");

  std::string buffer(m_type_size * _values.size(), '\0');
  for (size_t index = 0; index < _values.size(); index++)
  {
    status = to_dpt(remove_unit(_values[index]), buffer, index);
    if (status.NOk())
    {
      VLOG(1) << m_dpt.id << ": " << status;
      return status;
    }
  }

  m_data.swap(buffer);
  return status;
}

// ==========================================================================
std::string Translator::value() const
{
  const std::string text = make_string(0);
  return m_append_unit? append_unit(text) : text;
}

// ==========================================================================
std::vector<std::string> Translator::all_values() const
{
  std::vector<std::string> values;

  for (size_t index = 0; index < items(); index++)
  {
    const std::string text = make_string(index);
    values.push_back(m_append_unit? append_unit(text) : text);
  }
  return values;
}

// ==========================================================================
mgmt::Error Translator::set_data(const std::string& _data)
{
  if (_data.empty() || (_data.size() % m_type_size))
  {
    LOG(WARNING) << m_dpt.id << ": wrong data length " << hex_dump(_data)
                 << ", item size " << m_type_size;
    return mgmt::Error(mgmt::rtE_FORMAT, "data length " + std::to_string(_data.size())
                       + " is not a multiple of " + std::to_string(m_type_size));
  }

  m_data = _data;
  return mgmt::Error();
}

// ==========================================================================
std::string Translator::append_unit(const std::string& _text) const
{
  if (!m_dpt.unit || !m_dpt.unit[0])
    return _text;

  return _text + " " + m_dpt.unit;
}

// ==========================================================================
std::string Translator::remove_unit(const std::string& _text) const
{
  std::string text = trim(_text);
  const size_t unit_len = (m_dpt.unit)? strlen(m_dpt.unit) : 0;

  if (unit_len && (text.size() > unit_len)
   && (0 == text.compare(text.size() - unit_len, unit_len, m_dpt.unit)))
  {
    text = trim(text.substr(0, text.size() - unit_len));
  }
  return text;
}

// ==========================================================================
bool Translator::decode_number(const std::string& _text, bool& negative, uint64_t& magnitude)
{
  size_t pos = 0;
  unsigned int base = 10;

  negative = false;
  magnitude = 0;

  if (_text.empty())
    return false;

  if ((_text[pos] == '+') || (_text[pos] == '-'))
  {
    negative = (_text[pos] == '-');
    pos++;
  }

  if ((pos < _text.size()) && (_text[pos] == '#'))
  {
    base = 16;
    pos++;
  }
  else if ((pos + 1 < _text.size()) && (_text[pos] == '0')
        && ((_text[pos + 1] == 'x') || (_text[pos + 1] == 'X')))
  {
    base = 16;
    pos += 2;
  }
  else if ((pos + 1 < _text.size()) && (_text[pos] == '0'))
  {
    base = 8;
    pos++;
  }

  // Хотя бы одна цифра после знака и префикса
  if (pos >= _text.size())
    return false;

  for (; pos < _text.size(); pos++)
  {
    const unsigned char c = static_cast<unsigned char>(_text[pos]);
    unsigned int digit;

    if (isdigit(c))
      digit = c - '0';
    else if (isxdigit(c))
      digit = tolower(c) - 'a' + 10;
    else
      return false;

    if (digit >= base)
      return false;

    // Переполнение 64 бит
    if (magnitude > (UINT64_MAX - digit) / base)
      return false;

    magnitude = magnitude * base + digit;
  }

  return true;
}
