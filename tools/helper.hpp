#pragma once
#ifndef TOOLS_HELPER_HPP
#define TOOLS_HELPER_HPP

#if defined HAVE_CONFIG_H
#include "config.h"
#endif

#include <string>
#include <stdint.h>

// Текстовое представление буфера: как есть, если все символы печатные,
// иначе в шестнадцатеричном виде. В начале указывается размер: "[003] 0A0B0C"
std::string hex_dump(const std::string&);
std::string hex_dump(const char*, unsigned int);

// Перевести шестнадцатеричную строку ("FF00A1", допускаются пробелы) в байты.
// false, если строка содержит посторонние символы или нечетное число цифр.
bool hex_to_bytes(const std::string&, std::string&);

// Удалить пробельные символы в начале и в конце строки
std::string trim(const std::string&);

// Прочитать беззнаковое целое длиной size байт, старший байт первым
uint64_t get_unsigned_be(const std::string&, size_t offset, size_t size);
// Записать беззнаковое целое длиной size байт, старший байт первым
void put_unsigned_be(std::string&, size_t offset, size_t size, uint64_t);

#endif
