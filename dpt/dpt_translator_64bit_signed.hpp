// ==========================================================================
//  DPT 29.xxx: 64-битное целое со знаком (V64), старший байт первым
// ==========================================================================
#pragma once
#ifndef DPT_TRANSLATOR_64BIT_SIGNED_HPP
#define DPT_TRANSLATOR_64BIT_SIGNED_HPP

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <stdint.h>
#include <string>

#include "dpt_translator.hpp"

namespace dpt {

class Translator64BitSigned : public Translator
{
  public:
    // Активная энергия, Вт*ч
    static const DPT DPT_ACTIVE_ENERGY;
    // Полная энергия, ВА*ч
    static const DPT DPT_APPARENT_ENERGY;
    // Реактивная энергия, ВАр*ч
    static const DPT DPT_REACTIVE_ENERGY;

    explicit Translator64BitSigned(const DPT&);
    virtual ~Translator64BitSigned();

    using Translator::set_value;
    mgmt::Error set_value(int64_t);

    int64_t value_signed(size_t = 0) const;
    virtual double numeric_value() const;

  protected:
    virtual mgmt::Error to_dpt(const std::string&, std::string&, size_t) const;
    virtual std::string make_string(size_t) const;

  private:
    DISALLOW_COPY_AND_ASSIGN(Translator64BitSigned);
    mgmt::Error check_range(int64_t, const std::string&) const;

    int64_t m_min;
    int64_t m_max;
};

} // namespace dpt

#endif
