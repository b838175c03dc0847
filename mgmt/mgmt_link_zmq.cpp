#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

// Общесистемные заголовочные файлы
#include <string.h>
#include <chrono>
#include <thread>

// Служебные заголовочные файлы сторонних утилит
#include "glog/logging.h"

// Служебные файлы KNXMGMT
#include "helper.hpp"
#include "mgmt_message.hpp"
#include "mgmt_link_zmq.hpp"

using namespace mgmt;

//  ---------------------------------------------------------------------
ZmqLink::ZmqLink(const std::string& endpoint)
  : Link(endpoint),
    m_endpoint(endpoint),
    m_context(NULL),
    m_socket(NULL),
    m_mutex(),
    m_open(false),
    m_exchange_id(0),
    m_watcher()
{
}

//  ---------------------------------------------------------------------
ZmqLink::~ZmqLink()
{
  close();
  stop_watcher();

  try
  {
    delete m_context;
  }
  catch(zmq::error_t err)
  {
    LOG(ERROR) << err.what();
  }
}

//  ---------------------------------------------------------------------
Error ZmqLink::open()
{
  int linger = 0;
  int send_timeout_msec = SEND_TIMEOUT_MSEC;

  if (m_open)
    return Error();

  // Поток от предыдущего подключения, закрытого удаленной стороной
  stop_watcher();

  std::lock_guard<std::mutex> lock(m_mutex);

  try
  {
    if (!m_context)
      m_context = new zmq::context_t(1);

    m_socket = new zmq::socket_t(*m_context, ZMQ_DEALER);
    m_socket->setsockopt(ZMQ_LINGER, &linger, sizeof(linger));
    m_socket->setsockopt(ZMQ_SNDTIMEO, &send_timeout_msec, sizeof(send_timeout_msec));
    m_socket->connect(m_endpoint.c_str());

    m_open = true;
    LOG(INFO) << "Connecting to " << m_endpoint;
  }
  catch(zmq::error_t err)
  {
    LOG(ERROR) << "Connect to " << m_endpoint << ": " << err.what();
    shutdown_socket();
    return Error(rtE_LINK, err.what());
  }

  m_watcher = std::thread(&ZmqLink::watch, this);
  return Error();
}

//  ---------------------------------------------------------------------
//  Закрытие по инициативе владельца. Текущий обмен, если он есть,
//  обнаружит сброс флага на очередном шаге опроса и завершится.
void ZmqLink::close()
{
  bool expected = true;

  if (!m_open.compare_exchange_strong(expected, false))
  {
    stop_watcher();
    return;
  }

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    shutdown_socket();
  }
  stop_watcher();

  LOG(INFO) << "Link " << m_endpoint << " closed";
  fire_closed();
}

//  ---------------------------------------------------------------------
Error ZmqLink::exchange(KNXMGMT::PropertyRequest& request,
                        KNXMGMT::PropertyResponse& response,
                        int timeout_msec)
{
  bool closed_by_peer = false;
  Error status;

  {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_open)
      return Error(rtE_LINK, "link " + m_endpoint + " is closed");

    // Номер 0 зарезервирован для уведомлений
    if (0 == ++m_exchange_id)
      ++m_exchange_id;
    request.set_exchange_id(m_exchange_id);

    try
    {
      status = send_request(request);
      if (status.Ok())
        status = wait_response(request.exchange_id(), response, timeout_msec, closed_by_peer);
    }
    catch(zmq::error_t err)
    {
      LOG(ERROR) << "Exchange with " << m_endpoint << ": " << err.what();
      status.set(rtE_LINK, err.what());
    }

    if (closed_by_peer)
      shutdown_socket();
  }

  // Уведомление подписчиков вне m_mutex
  if (closed_by_peer)
  {
    LOG(WARNING) << "Link " << m_endpoint << " closed by peer";
    fire_closed();
  }

  return status;
}

//  ---------------------------------------------------------------------
Error ZmqLink::post(KNXMGMT::PropertyRequest& request)
{
  std::lock_guard<std::mutex> lock(m_mutex);

  if (!m_open)
    return Error(rtE_LINK, "link " + m_endpoint + " is closed");

  request.set_exchange_id(0);

  try
  {
    return send_request(request);
  }
  catch(zmq::error_t err)
  {
    LOG(ERROR) << "Post to " << m_endpoint << ": " << err.what();
    return Error(rtE_LINK, err.what());
  }
}

//  ---------------------------------------------------------------------
//  Since we're using a DEALER socket we have to send an empty frame
//  at the start, to create the same envelope that the REQ socket
//  would normally make for us
Error ZmqLink::send_request(const KNXMGMT::PropertyRequest& request)
{
  std::string payload;

  if (!request.SerializeToString(&payload))
    return Error(rtE_LINK, "unable to serialize request");

  zmq::message_t delimiter(0);
  zmq::message_t message(payload.size());
  memcpy(message.data(), payload.data(), payload.size());

  if (!m_socket->send(delimiter, ZMQ_SNDMORE) || !m_socket->send(message, 0))
  {
    LOG(ERROR) << "Send " << service_name(request.service()) << " to " << m_endpoint << ": timeout";
    return Error(rtE_LINK, "send timeout");
  }

  VLOG(1) << "=> " << service_name(request.service()) << " #" << request.exchange_id()
          << " " << hex_dump(payload);
  return Error();
}

//  ---------------------------------------------------------------------
//  Ожидание ответа короткими шагами, чтобы вовремя заметить закрытие канала
Error ZmqLink::wait_response(uint32_t exchange_id,
                             KNXMGMT::PropertyResponse& response,
                             int timeout_msec,
                             bool& closed_by_peer)
{
  const std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_msec);
  zmq::pollitem_t items[1];
  Error status;

  items[0].socket = (void*)*m_socket; // NB: оператор (void*) обязателен!
  items[0].fd = 0;
  items[0].events = ZMQ_POLLIN;
  items[0].revents = 0;

  while (true)
  {
    if (!m_open)
      return Error(rtE_LINK, "link " + m_endpoint + " closed");

    const long remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                             deadline - std::chrono::steady_clock::now()).count();
    if (remaining <= 0)
      break;

    items[0].revents = 0;
    zmq::poll(items, 1, (remaining < POLL_SLICE_MSEC)? remaining : POLL_SLICE_MSEC);

    if (!(items[0].revents & ZMQ_POLLIN))
      continue;

    status = receive(response);
    if (status.NOk())
      return status;

    if ((0 == response.exchange_id()) && (KNXMGMT::SVC_DISCONNECT == response.service()))
    {
      bool expected = true;
      // Уведомлять подписчиков только если канал не закрыт раньше
      closed_by_peer = m_open.compare_exchange_strong(expected, false);
      return Error(rtE_LINK, "link " + m_endpoint + " closed by peer");
    }

    if (response.exchange_id() != exchange_id)
    {
      // Запоздавший ответ на предыдущий запрос
      LOG(WARNING) << "Drop stale response #" << response.exchange_id()
                   << ", waiting for #" << exchange_id;
      continue;
    }

    return Error();
  }

  LOG(WARNING) << "No response #" << exchange_id << " from " << m_endpoint
               << " within " << timeout_msec << " msec";
  return Error(rtE_TIMEOUT);
}

//  ---------------------------------------------------------------------
//  Прочитать все кадры сообщения, вернуть последний непустой
Error ZmqLink::recv_frames(std::string& payload)
{
  payload.clear();

  do
  {
    zmq::message_t message(0);
    if (!m_socket->recv(&message, 0))
      return Error(rtE_LINK, "receive failed");

    if (message.size())
      payload.assign(static_cast<const char*>(message.data()), message.size());

    if (!message.more())
      break;
  } while (true);

  return Error();
}

//  ---------------------------------------------------------------------
Error ZmqLink::receive(KNXMGMT::PropertyResponse& response)
{
  std::string payload;
  Error status = recv_frames(payload);

  if (status.NOk())
    return status;

  response.Clear();
  if (!response.ParseFromString(payload))
  {
    LOG(ERROR) << "Malformed response from " << m_endpoint << ": " << hex_dump(payload);
    return Error(rtE_LINK, "malformed response");
  }

  VLOG(1) << "<= " << service_name(response.service()) << " #" << response.exchange_id()
          << " " << hex_dump(payload);
  return Error();
}

//  ---------------------------------------------------------------------
//  Разобрать сообщения, пришедшие вне обмена.
//  true, если удаленная сторона закрыла канал.
bool ZmqLink::drain()
{
  KNXMGMT::PropertyResponse notice;
  zmq::pollitem_t items[1];

  items[0].socket = (void*)*m_socket;
  items[0].fd = 0;
  items[0].events = ZMQ_POLLIN;

  while (true)
  {
    items[0].revents = 0;
    zmq::poll(items, 1, 0);
    if (!(items[0].revents & ZMQ_POLLIN))
      return false;

    if (receive(notice).NOk())
      return false;

    if ((0 == notice.exchange_id()) && (KNXMGMT::SVC_DISCONNECT == notice.service()))
    {
      bool expected = true;
      if (!m_open.compare_exchange_strong(expected, false))
        return false;

      shutdown_socket();
      return true;
    }

    LOG(WARNING) << "Drop unexpected " << service_name(notice.service())
                 << " #" << notice.exchange_id() << " from " << m_endpoint;
  }
}

//  ---------------------------------------------------------------------
void ZmqLink::watch()
{
  while (m_open)
  {
    bool closed_by_peer = false;

    {
      std::lock_guard<std::mutex> lock(m_mutex);

      if (!m_open)
        break;

      try
      {
        closed_by_peer = drain();
      }
      catch(zmq::error_t err)
      {
        LOG(ERROR) << "Watch " << m_endpoint << ": " << err.what();
      }
    }

    if (closed_by_peer)
    {
      LOG(WARNING) << "Link " << m_endpoint << " closed by peer";
      // Подписчик может удалить канал, после уведомления члены класса не трогаем
      fire_closed();
      return;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(POLL_SLICE_MSEC));
  }
}

//  ---------------------------------------------------------------------
void ZmqLink::stop_watcher()
{
  if (!m_watcher.joinable())
    return;

  // Закрытие из уведомления, полученного в самом потоке наблюдения
  if (m_watcher.get_id() == std::this_thread::get_id())
    m_watcher.detach();
  else
    m_watcher.join();
}

//  ---------------------------------------------------------------------
void ZmqLink::shutdown_socket()
{
  try
  {
    if (m_socket)
    {
      m_socket->close();
      delete m_socket;
      m_socket = NULL;
    }
  }
  catch(zmq::error_t err)
  {
    LOG(ERROR) << err.what();
  }
}
