#pragma once
#ifndef TOOLS_LISTENERS_HPP
#define TOOLS_LISTENERS_HPP

#if defined HAVE_CONFIG_H
#include "config.h"
#endif

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "glog/logging.h"

namespace tool
{

/////////////////////////////////////////////////////////////////////////////////////////
// Контейнер подписчиков на события.
//
// Основная операция - обход подписчиков при доставке события, добавление
// и удаление подписчиков редки. Поэтому при каждом изменении публикуется
// новая неизменяемая копия списка, а доставка работает с этой копией,
// не захватывая мьютекс изменений.
/////////////////////////////////////////////////////////////////////////////////////////
template<typename T>
class ListenerRegistry
{
  public:
    typedef std::vector<T*> list_type;
    typedef std::shared_ptr<const list_type> snapshot_type;
    typedef std::function<void(T*)> action_type;

    ListenerRegistry()
      : m_mutex(),
        m_listeners(),
        m_snapshot(std::make_shared<const list_type>())
    {
    }

   ~ListenerRegistry()
    {
    }

    //  ---------------------------------------------------------------------
    //  Добавить подписчика. NULL и повторное добавление игнорируются.
    void add(T* listener)
    {
      if (!listener)
        return;

      std::lock_guard<std::mutex> lock(m_mutex);
      if (m_listeners.end() == std::find(m_listeners.begin(), m_listeners.end(), listener))
      {
        m_listeners.push_back(listener);
        publish();
      }
      else
      {
        LOG(WARNING) << "Listener " << listener << " already registered";
      }
    }

    //  ---------------------------------------------------------------------
    //  Удалить подписчика, если он был зарегистрирован
    void remove(T* listener)
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      typename list_type::iterator it = std::find(m_listeners.begin(), m_listeners.end(), listener);
      if (it != m_listeners.end())
      {
        m_listeners.erase(it);
        publish();
      }
    }

    void remove_all()
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_listeners.clear();
      publish();
    }

    //  ---------------------------------------------------------------------
    //  Текущий список подписчиков. Последующие изменения реестра
    //  на уже полученный список не влияют.
    snapshot_type snapshot() const
    {
      return std::atomic_load(&m_snapshot);
    }

    size_t size() const { return snapshot()->size(); }
    bool   empty() const { return snapshot()->empty(); }

    //  ---------------------------------------------------------------------
    //  Доставить событие всем подписчикам в порядке регистрации.
    //  Подписчик, выбросивший исключение, считается неисправным и удаляется.
    void fire(const action_type& action)
    {
      const snapshot_type list = snapshot();

      for (typename list_type::const_iterator it = list->begin(); it != list->end(); ++it)
      {
        try
        {
          action(*it);
        }
        catch(const std::exception& e)
        {
          remove(*it);
          LOG(ERROR) << "Removed event listener " << *it << ": " << e.what();
        }
        catch(...)
        {
          remove(*it);
          LOG(ERROR) << "Removed event listener " << *it << ": unknown exception";
        }
      }
    }

  private:
    DISALLOW_COPY_AND_ASSIGN(ListenerRegistry);
    // NB: вызывается под m_mutex
    void publish()
    {
      snapshot_type copy = std::make_shared<const list_type>(m_listeners);
      std::atomic_store(&m_snapshot, copy);
    }

    std::mutex    m_mutex;
    list_type     m_listeners;
    snapshot_type m_snapshot;
};

} // namespace tool

#endif
