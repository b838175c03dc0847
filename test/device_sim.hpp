// ==========================================================================
//  Имитатор шлюза для тестов канала ZeroMQ.
//  Сокет ROUTER принимает запросы клиентов (DEALER) и передает их модели
//  устройства. Ответ отправляется с задержкой, заданной в модели.
// ==========================================================================
#pragma once
#ifndef TEST_DEVICE_SIM_HPP
#define TEST_DEVICE_SIM_HPP

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <atomic>
#include <set>
#include <string>
#include <thread>

#include "zmq.hpp"

#include "mgmt_error.hpp"
#include "device_model.hpp"

namespace sim {

class DeviceSim
{
  public:
    DeviceSim(DeviceModel*);
   ~DeviceSim();

    // Привязать сокет к новой точке доступа и запустить нить обработки
    mgmt::Error start();
    void stop();

    const std::string& endpoint() const { return m_endpoint; };
    // Отправить всем известным клиентам уведомление о разрыве соединения
    void disconnect_peers() { m_disconnect = true; };
    int peers() const { return m_peers_count; };

  private:
    DISALLOW_COPY_AND_ASSIGN(DeviceSim);
    void run();
    void process();
    void send_disconnect();
    void send(const std::string&, const KNXMGMT::PropertyResponse&);

    DeviceModel      *m_model;
    std::string       m_endpoint;
    zmq::context_t   *m_context;
    zmq::socket_t    *m_socket;
    std::thread      *m_thread;
    std::atomic<bool> m_running;
    std::atomic<bool> m_disconnect;
    std::atomic<int>  m_peers_count;
    std::set<std::string> m_peers;
};

} // namespace sim

#endif
