#if defined HAVE_CONFIG_H
#include "config.h"
#endif
#include "mgmt_error.hpp"

using namespace mgmt;

static const char* g_error_descriptions[Error::MaxErrorCode + 1] = {
  /* rtE_NONE */              "OK",
  /* rtE_UNKNOWN */           "Unknown error",
  /* rtE_ILLEGAL_STATE */     "Illegal state, access is closed",
  /* rtE_TIMEOUT */           "Response timeout",
  /* rtE_FORMAT */            "Wrong value format",
  /* rtE_NO_SUCH_PROPERTY */  "No such property or object",
  /* rtE_ACCESS_DENIED */     "Access denied",
  /* rtE_UNKNOWN_TYPE */      "Unknown property datatype",
  /* rtE_ILLEGAL_PARAMETER_VALUE */ "Illegal parameter value",
  /* rtE_NOT_SUPPORTED */     "Not supported",
  /* rtE_LINK */              "Link failure",
  /* rtE_REMOTE */            "Remote device failure",
  /* rtE_CONFIG */            "Configuration error",
  /* rtE_LAST */              "Bad error code"
};

Error::Error() :
  m_error_code(rtE_NONE),
  m_detail()
{
}

Error::Error(ErrorCode_t _t) :
  m_error_code(rtE_NONE),
  m_detail()
{
  set(_t);
}

Error::Error(ErrorCode_t _t, const std::string& _detail) :
  m_error_code(rtE_NONE),
  m_detail()
{
  set(_t, _detail);
}

Error::Error(const Error& _origin) :
  m_error_code(_origin.m_error_code),
  m_detail(_origin.m_detail)
{
}

Error::~Error()
{
}

Error& Error::operator=(const Error& _origin)
{
  m_error_code = _origin.m_error_code;
  m_detail = _origin.m_detail;
  return *this;
}

const char* Error::what() const
{
  return g_error_descriptions[m_error_code];
}

const char* Error::what(int _code)
{
  if ((rtE_NONE <= _code) && (_code < rtE_LAST))
    return g_error_descriptions[_code];

  return g_error_descriptions[rtE_LAST];
}

void Error::set(ErrorCode_t _t)
{
  if ((rtE_NONE <= _t) && (_t < rtE_LAST))
  {
    m_error_code = _t;
  }
  else
  {
    m_error_code = rtE_UNKNOWN;
  }
  m_detail.clear();
}

void Error::set(ErrorCode_t _t, const std::string& _detail)
{
  set(_t);
  m_detail = _detail;
}

// Получить код ошибки
int Error::getCode() const
{
  return m_error_code;
}

std::ostream& mgmt::operator<<(std::ostream& os, const Error& err)
{
  os << err.what();
  if (!err.detail().empty())
    os << ": " << err.detail();
  return os;
}
