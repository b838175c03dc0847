// ==========================================================================
//  Реестр трансляторов: идентификатор DPT -> (описание типа, фабрика)
// ==========================================================================
#pragma once
#ifndef DPT_REGISTRY_HPP
#define DPT_REGISTRY_HPP

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <string>
#include <vector>

#include "mgmt_error.hpp"
#include "dpt_translator.hpp"

namespace dpt {

class TranslatorRegistry
{
  public:
    typedef Translator* (*factory_t)(const DPT&);

    typedef struct {
      const DPT* dpt;
      factory_t  factory;
    } entry_t;

    // Создать транслятор для типа с идентификатором id ("29.010").
    // Освобождение полученного экземпляра возлагается на вызывающую сторону.
    // NULL и rtE_UNKNOWN_TYPE, если тип не поддерживается.
    static Translator* create(const std::string&, mgmt::Error&);

    static bool supported(const std::string&);
    // Описание типа, NULL если тип не поддерживается
    static const DPT* lookup(const std::string&);
    // Идентификаторы всех поддерживаемых типов в порядке регистрации
    static std::vector<std::string> ids();

  private:
    static const entry_t* find(const std::string&);
    static const entry_t m_entries[];
};

} // namespace dpt

#endif
