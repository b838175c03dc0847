#if defined HAVE_CONFIG_H
#include "config.h"
#endif

#include <assert.h>
#include <ctype.h>
#include <stdio.h>

#include <string>

#include "helper.hpp"

std::string hex_dump(const std::string& data)
{
  return hex_dump(data.data(), static_cast<unsigned int>(data.size()));
}

std::string hex_dump(const char* data, unsigned int size)
{
   std::string result;
   char buf[8];
   bool is_text = true;
   unsigned int char_nbr;

   // Dump the message as text or binary
   for (char_nbr = 0; char_nbr < size; char_nbr++)
   {
       if (static_cast<unsigned char>(data[char_nbr]) < 32
        || static_cast<unsigned char>(data[char_nbr]) > 127)
        {
           // Встречаются непечатные символы, выводим в двоичном виде
           is_text = false;
           break;
        }
   }

   snprintf(buf, sizeof(buf), "[%03u] ", size);
   result.assign(buf);
   result.reserve(result.size() + 2 * size);

   for (char_nbr = 0; char_nbr < size; char_nbr++)
   {
       if (is_text)
       {
           result.push_back(data[char_nbr]);
       }
       else
       {
           snprintf(buf, 3, "%02X", static_cast<unsigned char>(data[char_nbr]));
           result.append(buf, 2);
       }
   }
   return result;
}

static int hex_digit(char c)
{
  if (('0' <= c) && (c <= '9')) return c - '0';
  if (('a' <= c) && (c <= 'f')) return c - 'a' + 10;
  if (('A' <= c) && (c <= 'F')) return c - 'A' + 10;
  return -1;
}

bool hex_to_bytes(const std::string& text, std::string& bytes)
{
  std::string digits;

  for (size_t i = 0; i < text.size(); i++)
  {
    if (isspace(static_cast<unsigned char>(text[i])))
      continue;
    if (hex_digit(text[i]) < 0)
      return false;
    digits.push_back(text[i]);
  }

  if (digits.size() % 2)
    return false;

  bytes.clear();
  for (size_t i = 0; i < digits.size(); i += 2)
  {
    bytes.push_back(static_cast<char>((hex_digit(digits[i]) << 4) | hex_digit(digits[i + 1])));
  }
  return true;
}

std::string trim(const std::string& text)
{
  size_t first = 0;
  size_t last = text.size();

  while ((first < last) && isspace(static_cast<unsigned char>(text[first])))
    first++;
  while ((last > first) && isspace(static_cast<unsigned char>(text[last - 1])))
    last--;

  return text.substr(first, last - first);
}

uint64_t get_unsigned_be(const std::string& data, size_t offset, size_t size)
{
  uint64_t value = 0;

  assert(offset + size <= data.size());
  for (size_t i = 0; i < size; i++)
  {
    value = (value << 8) | static_cast<unsigned char>(data[offset + i]);
  }
  return value;
}

void put_unsigned_be(std::string& data, size_t offset, size_t size, uint64_t value)
{
  assert(offset + size <= data.size());
  for (size_t i = size; i > 0; i--)
  {
    data[offset + i - 1] = static_cast<char>(value & 0xFF);
    value >>= 8;
  }
}
