#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <functional>

#include "glog/logging.h"

#include "mgmt_link.hpp"

using namespace mgmt;

Link::Link(const std::string& _name)
  : m_name(_name),
    m_listeners()
{
}

Link::~Link()
{
}

void Link::add_listener(LinkListener* listener)
{
  m_listeners.add(listener);
}

void Link::remove_listener(LinkListener* listener)
{
  m_listeners.remove(listener);
}

void Link::fire_closed()
{
  VLOG(1) << "Link " << m_name << ": notify " << m_listeners.size() << " listener(s)";
  m_listeners.fire(std::bind(&LinkListener::link_closed, std::placeholders::_1, this));
}
