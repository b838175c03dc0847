#pragma once
#ifndef MGMT_LINK_ZMQ_HPP
#define MGMT_LINK_ZMQ_HPP

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <stdint.h>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include "zmq.hpp"

#include "mgmt_link.hpp"

namespace mgmt {

// ==========================================================================
// Канал поверх сокета ZeroMQ DEALER.
// Кадры сообщения: пустой разделитель, сериализованный PropertyRequest
// (PropertyResponse в обратном направлении).
// Пока обмена нет, поток наблюдения принимает уведомления от удаленной
// стороны, чтобы разрыв был замечен и без очередного запроса.
// ==========================================================================
class ZmqLink : public Link
{
  public:
    ZmqLink(const std::string&);
    virtual ~ZmqLink();

    const std::string& endpoint() const { return m_endpoint; };

    // Подключиться к точке доступа
    Error open();

    virtual bool is_open() const { return m_open; };
    virtual Error exchange(KNXMGMT::PropertyRequest&, KNXMGMT::PropertyResponse&, int);
    virtual Error post(KNXMGMT::PropertyRequest&);
    virtual void close();

  private:
    DISALLOW_COPY_AND_ASSIGN(ZmqLink);
    // NB: методы ниже вызываются под m_mutex
    Error send_request(const KNXMGMT::PropertyRequest&);
    Error wait_response(uint32_t, KNXMGMT::PropertyResponse&, int, bool&);
    Error recv_frames(std::string&);
    Error receive(KNXMGMT::PropertyResponse&);
    bool  drain();
    void  shutdown_socket();
    // Поток наблюдения, m_mutex не удерживают
    void  watch();
    void  stop_watcher();

    std::string       m_endpoint;
    zmq::context_t   *m_context;
    zmq::socket_t    *m_socket;
    std::mutex        m_mutex;
    std::atomic<bool> m_open;
    uint32_t          m_exchange_id;
    std::thread       m_watcher;
};

} // namespace mgmt

#endif
