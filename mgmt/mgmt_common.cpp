#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <stdio.h>
#include <stdlib.h>

#include "helper.hpp"
#include "mgmt_common.hpp"

std::string mgmt::address_to_string(int address)
{
  char buffer[16];

  snprintf(buffer, sizeof(buffer), "%d.%d.%d",
           (address >> 12) & 0x0F,
           (address >> 8) & 0x0F,
           address & 0xFF);

  return std::string(buffer);
}

bool mgmt::parse_individual_address(const std::string& text, int& address)
{
  const std::string value = trim(text);
  unsigned int area, line, device;
  char tail;
  char* end = NULL;

  if (value.empty())
    return false;

  if (3 == sscanf(value.c_str(), "%u.%u.%u%c", &area, &line, &device, &tail))
  {
    if ((area > 0x0F) || (line > 0x0F) || (device > 0xFF))
      return false;

    address = (area << 12) | (line << 8) | device;
    return true;
  }

  // Адрес задан числом
  const unsigned long raw = strtoul(value.c_str(), &end, 0);
  if (*end || (raw > 0xFFFF))
    return false;

  address = static_cast<int>(raw);
  return true;
}
