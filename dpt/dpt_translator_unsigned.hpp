// ==========================================================================
//  Беззнаковые целые DPT:
//    5.xxx  - 8 бит (U8)
//    7.xxx  - 16 бит (U16)
//    12.xxx - 32 бита (U32)
//  Значения передаются старшим байтом вперед.
// ==========================================================================
#pragma once
#ifndef DPT_TRANSLATOR_UNSIGNED_HPP
#define DPT_TRANSLATOR_UNSIGNED_HPP

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <stdint.h>
#include <string>

#include "dpt_translator.hpp"

namespace dpt {

class TranslatorUnsigned : public Translator
{
  public:
    static const DPT DPT_SCALING;         // 5.004, 0..255 %
    static const DPT DPT_VALUE_1_UCOUNT;  // 5.010
    static const DPT DPT_VALUE_2_UCOUNT;  // 7.001
    static const DPT DPT_TIMEPERIOD;      // 7.002, мс
    static const DPT DPT_VALUE_4_UCOUNT;  // 12.001

    explicit TranslatorUnsigned(const DPT&);
    virtual ~TranslatorUnsigned();

    using Translator::set_value;
    mgmt::Error set_value(uint64_t);

    uint64_t value_unsigned(size_t = 0) const;
    virtual double numeric_value() const;

    // Размер элемента по главному номеру DPT, 0 для неподдерживаемых
    static size_t size_of(const DPT&);

  protected:
    virtual mgmt::Error to_dpt(const std::string&, std::string&, size_t) const;
    virtual std::string make_string(size_t) const;

  private:
    DISALLOW_COPY_AND_ASSIGN(TranslatorUnsigned);
    mgmt::Error check_range(uint64_t, const std::string&) const;

    uint64_t m_min;
    uint64_t m_max;
};

} // namespace dpt

#endif
