#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <string.h>

#include "glog/logging.h"

#include "helper.hpp"
#include "dpt_registry.hpp"
#include "dpt_translator_64bit_signed.hpp"
#include "dpt_translator_unsigned.hpp"

using namespace dpt;

static Translator* create_64bit_signed(const DPT& _dpt)
{
  return new Translator64BitSigned(_dpt);
}

static Translator* create_unsigned(const DPT& _dpt)
{
  return new TranslatorUnsigned(_dpt);
}

const TranslatorRegistry::entry_t TranslatorRegistry::m_entries[] = {
  { &TranslatorUnsigned::DPT_SCALING,               create_unsigned },
  { &TranslatorUnsigned::DPT_VALUE_1_UCOUNT,        create_unsigned },
  { &TranslatorUnsigned::DPT_VALUE_2_UCOUNT,        create_unsigned },
  { &TranslatorUnsigned::DPT_TIMEPERIOD,            create_unsigned },
  { &TranslatorUnsigned::DPT_VALUE_4_UCOUNT,        create_unsigned },
  { &Translator64BitSigned::DPT_ACTIVE_ENERGY,      create_64bit_signed },
  { &Translator64BitSigned::DPT_APPARENT_ENERGY,    create_64bit_signed },
  { &Translator64BitSigned::DPT_REACTIVE_ENERGY,    create_64bit_signed },
  { NULL,                                           NULL }
};

// ==========================================================================
const TranslatorRegistry::entry_t* TranslatorRegistry::find(const std::string& _id)
{
  const std::string id = trim(_id);

  for (const entry_t* entry = m_entries; entry->dpt; entry++)
  {
    if (0 == strcmp(entry->dpt->id, id.c_str()))
      return entry;
  }
  return NULL;
}

// ==========================================================================
Translator* TranslatorRegistry::create(const std::string& _id, mgmt::Error& _status)
{
  const entry_t* entry = find(_id);

  if (!entry)
  {
    _status.set(mgmt::rtE_UNKNOWN_TYPE, "DPT " + _id);
    LOG(WARNING) << "No translator for DPT '" << _id << "'";
    return NULL;
  }

  _status.clear();
  return entry->factory(*entry->dpt);
}

// ==========================================================================
bool TranslatorRegistry::supported(const std::string& _id)
{
  return (NULL != find(_id));
}

// ==========================================================================
const DPT* TranslatorRegistry::lookup(const std::string& _id)
{
  const entry_t* entry = find(_id);
  return (entry)? entry->dpt : NULL;
}

// ==========================================================================
std::vector<std::string> TranslatorRegistry::ids()
{
  std::vector<std::string> result;

  for (const entry_t* entry = m_entries; entry->dpt; entry++)
    result.push_back(entry->dpt->id);

  return result;
}
