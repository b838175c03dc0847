#include "glog/logging.h"
#include "gtest/gtest.h"

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mgmt_common.hpp"
#include "mgmt_error.hpp"
#include "mgmt_message.hpp"
#include "mgmt_link_zmq.hpp"
#include "mgmt_transport.hpp"
#include "mgmt_transport_remote.hpp"
#include "mgmt_transport_local.hpp"
#include "device_model.hpp"
#include "device_sim.hpp"

using namespace mgmt;

#define DEVICE_ADDRESS  0x1104
// Таймаут ответа имитатора в обычных тестах, мсек
#define TEST_TIMEOUT    2000

// Уведомления приходят и из потока наблюдения канала
class CloseRecorder : public TransportListener
{
  public:
    virtual void transport_closed(const CloseEvent& event)
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_events.push_back(event);
    };

    std::vector<CloseEvent> events()
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      return m_events;
    };

  private:
    std::mutex m_mutex;
    std::vector<CloseEvent> m_events;
};

static void wait_msec(int msec)
{
  std::this_thread::sleep_for(std::chrono::milliseconds(msec));
}

// ==========================================================================
TEST(TestZMQLINK, EXCHANGE)
{
  sim::DeviceModel device(DEVICE_ADDRESS);
  sim::DeviceSim simulator(&device);
  KNXMGMT::PropertyRequest request;
  KNXMGMT::PropertyResponse response;

  sim::populate_device(device);
  ASSERT_TRUE(simulator.start().Ok());

  ZmqLink link(simulator.endpoint());
  EXPECT_FALSE(link.is_open());
  ASSERT_TRUE(link.open().Ok());
  EXPECT_TRUE(link.is_open());

  make_property_read(request, 0, PID_MAX_APDULENGTH, 1, 1);
  ASSERT_TRUE(link.exchange(request, response, TEST_TIMEOUT).Ok());
  EXPECT_NE(request.exchange_id(), 0U);
  EXPECT_EQ(response.exchange_id(), request.exchange_id());
  EXPECT_TRUE(response_status(response).Ok());
  EXPECT_EQ(response.data(), std::string("\x00\x37", 2));

  // Номера обменов не повторяются
  const uint32_t previous = request.exchange_id();
  make_property_read(request, 0, PID_OBJECT_TYPE, 1, 1);
  ASSERT_TRUE(link.exchange(request, response, TEST_TIMEOUT).Ok());
  EXPECT_NE(request.exchange_id(), previous);

  link.close();
  EXPECT_FALSE(link.is_open());
  EXPECT_EQ(link.exchange(request, response, TEST_TIMEOUT).code(), rtE_LINK);
  EXPECT_EQ(link.post(request).code(), rtE_LINK);
}

TEST(TestZMQLINK, REMOTE_TRANSPORT)
{
  sim::DeviceModel device(DEVICE_ADDRESS);
  sim::DeviceSim simulator(&device);
  Description description;
  std::string data;
  Error status;

  sim::populate_device(device);
  ASSERT_TRUE(simulator.start().Ok());

  ZmqLink link(simulator.endpoint());
  ASSERT_TRUE(link.open().Ok());

  RemoteTransport* transport = RemoteTransport::create(&link, DEVICE_ADDRESS, NULL, true, "", status);
  ASSERT_TRUE(transport != NULL);
  ASSERT_TRUE(status.Ok());
  transport->set_timeout(TEST_TIMEOUT);

  ASSERT_TRUE(transport->get_description_by_index(0, 5, description).Ok());
  EXPECT_EQ(description.pid(), PID_IO_LIST);
  EXPECT_EQ(description.current_elements(), 3);

  const std::string version("\x00\x01\x02\x03\x07", 5);
  ASSERT_TRUE(transport->set_property(0, PID_PROGRAM_VERSION, 1, 1, version).Ok());
  ASSERT_TRUE(transport->get_property(0, PID_PROGRAM_VERSION, 1, 1, data).Ok());
  EXPECT_EQ(data, version);

  EXPECT_EQ(transport->get_property(0, 99, 1, 1, data).code(), rtE_NO_SUCH_PROPERTY);

  delete transport;
  // Уведомление DISCONNECT обрабатывается имитатором асинхронно
  wait_msec(200);
  EXPECT_EQ(device.connects(), 1);
  EXPECT_EQ(device.disconnects(), 1);
}

TEST(TestZMQLINK, TIMEOUT)
{
  sim::DeviceModel device(DEVICE_ADDRESS);
  sim::DeviceSim simulator(&device);
  std::string data;

  sim::populate_device(device);
  ASSERT_TRUE(simulator.start().Ok());

  ZmqLink link(simulator.endpoint());
  ASSERT_TRUE(link.open().Ok());
  RemoteTransport transport(&link, DEVICE_ADDRESS, NULL, false);

  device.set_silent(true);
  transport.set_timeout(200);

  const std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();
  EXPECT_EQ(transport.get_property(0, PID_OBJECT_TYPE, 1, 1, data).code(), rtE_TIMEOUT);
  const long elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - started).count();
  EXPECT_GE(elapsed, 200);
  EXPECT_LT(elapsed, 1500);

  EXPECT_TRUE(transport.is_open());
  EXPECT_TRUE(link.is_open());
}

TEST(TestZMQLINK, STALE_RESPONSE)
{
  sim::DeviceModel device(DEVICE_ADDRESS);
  sim::DeviceSim simulator(&device);
  std::string data;

  sim::populate_device(device);
  ASSERT_TRUE(simulator.start().Ok());

  ZmqLink link(simulator.endpoint());
  ASSERT_TRUE(link.open().Ok());
  RemoteTransport transport(&link, DEVICE_ADDRESS, NULL, false);

  // Ответ приходит позже таймаута
  device.set_delay(400);
  transport.set_timeout(100);
  EXPECT_EQ(transport.get_property(2, PID_OBJECT_TYPE, 1, 1, data).code(), rtE_TIMEOUT);

  // Запоздавший ответ на первый запрос отбрасывается
  device.set_delay(0);
  transport.set_timeout(TEST_TIMEOUT);
  ASSERT_TRUE(transport.get_property(0, PID_MAX_APDULENGTH, 1, 1, data).Ok());
  EXPECT_EQ(data, std::string("\x00\x37", 2));
}

TEST(TestZMQLINK, PEER_DISCONNECT)
{
  sim::DeviceModel device(DEVICE_ADDRESS);
  sim::DeviceSim simulator(&device);
  CloseRecorder recorder;
  std::string data;

  sim::populate_device(device);
  ASSERT_TRUE(simulator.start().Ok());

  ZmqLink link(simulator.endpoint());
  ASSERT_TRUE(link.open().Ok());
  RemoteTransport first(&link, DEVICE_ADDRESS, &recorder, false);
  RemoteTransport second(&link, DEVICE_ADDRESS + 1, &recorder, false);
  first.set_timeout(TEST_TIMEOUT);

  // Имитатор узнает клиента по первому запросу
  ASSERT_TRUE(first.get_property(0, PID_OBJECT_TYPE, 1, 1, data).Ok());
  EXPECT_EQ(simulator.peers(), 1);

  simulator.disconnect_peers();
  wait_msec(300);

  // Разрыв замечен без очередного запроса
  EXPECT_FALSE(link.is_open());
  EXPECT_FALSE(first.is_open());
  EXPECT_FALSE(second.is_open());

  ASSERT_EQ(recorder.events().size(), 2U);
  EXPECT_EQ(recorder.events()[0].source(), &first);
  EXPECT_EQ(recorder.events()[1].source(), &second);
  EXPECT_EQ(recorder.events()[0].initiator(), CLOSED_BY_LINK);
  EXPECT_EQ(recorder.events()[1].initiator(), CLOSED_BY_LINK);

  EXPECT_EQ(first.get_property(0, PID_OBJECT_TYPE, 1, 1, data).code(), rtE_ILLEGAL_STATE);
  EXPECT_EQ(second.get_property(0, PID_OBJECT_TYPE, 1, 1, data).code(), rtE_ILLEGAL_STATE);

  first.close();
  second.close();
  link.close();
  EXPECT_EQ(recorder.events().size(), 2U);
}

TEST(TestZMQLINK, CLOSE_WHILE_WAITING)
{
  sim::DeviceModel device(DEVICE_ADDRESS);
  sim::DeviceSim simulator(&device);
  CloseRecorder recorder;
  Error result;

  sim::populate_device(device);
  device.set_silent(true);
  ASSERT_TRUE(simulator.start().Ok());

  ZmqLink link(simulator.endpoint());
  ASSERT_TRUE(link.open().Ok());
  RemoteTransport transport(&link, DEVICE_ADDRESS, &recorder, false);
  transport.set_timeout(5000);

  const std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();
  std::thread waiter([&transport, &result]() {
    std::string data;
    result = transport.get_property(0, PID_OBJECT_TYPE, 1, 1, data);
  });

  wait_msec(200);
  link.close();
  waiter.join();

  const long elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - started).count();
  EXPECT_LT(elapsed, 2000);
  // В зависимости от того, кто успел раньше: канал или транспорт
  EXPECT_TRUE((result.code() == rtE_LINK) || (result.code() == rtE_ILLEGAL_STATE)) << result;

  ASSERT_EQ(recorder.events().size(), 1U);
  EXPECT_EQ(recorder.events()[0].initiator(), CLOSED_BY_LINK);
  EXPECT_FALSE(transport.is_open());
}

TEST(TestZMQLINK, LOCAL_OPEN)
{
  sim::DeviceModel device(DEVICE_ADDRESS);
  sim::DeviceSim simulator(&device);
  CloseRecorder recorder;
  const std::string key("\xAA\xBB", 2);
  Description description;
  Error status;

  sim::populate_device(device);
  device.set_local_mode(true);
  device.set_key(key, 0);
  ASSERT_TRUE(simulator.start().Ok());

  LocalTransport* transport = LocalTransport::open(simulator.endpoint(), &recorder, key, status);
  ASSERT_TRUE(transport != NULL);
  EXPECT_TRUE(status.Ok()) << status;
  EXPECT_EQ(transport->access_level(), ACCESS_LEVEL_MAX);
  transport->set_timeout(TEST_TIMEOUT);

  ASSERT_TRUE(transport->get_description_by_index(2, 4, description).Ok());
  EXPECT_EQ(description.object_type(), OT_APPLICATION_PROGRAM);
  EXPECT_EQ(description.pid(), PID_PROGRAM_VERSION);
  EXPECT_EQ(description.pdt(), PDT_UNKNOWN);
  EXPECT_EQ(description.current_elements(), 1);

  transport->close();
  ASSERT_EQ(recorder.events().size(), 1U);
  EXPECT_EQ(recorder.events()[0].initiator(), CLOSED_BY_USER);
  delete transport;
  EXPECT_EQ(recorder.events().size(), 1U);
}

TEST(TestZMQLINK, OPEN_FAILURES)
{
  Error status;

  ZmqLink bogus("bogus://nowhere");
  EXPECT_EQ(bogus.open().code(), rtE_LINK);
  EXPECT_FALSE(bogus.is_open());

  EXPECT_TRUE(LocalTransport::open("bogus://nowhere", NULL, "", status) == NULL);
  EXPECT_EQ(status.code(), rtE_LINK);

  // Канал не открыт
  ZmqLink closed("ipc:///tmp/knxmgmt_unused");
  EXPECT_TRUE(RemoteTransport::create(&closed, DEVICE_ADDRESS, NULL, false, "", status) == NULL);
  EXPECT_EQ(status.code(), rtE_LINK);
}

int main(int argc, char** argv)
{
  ::google::InitGoogleLogging(argv[0]);
  ::testing::InitGoogleTest(&argc, argv);
  ::google::InstallFailureSignalHandler();

  int retval = RUN_ALL_TESTS();

  ::google::ShutdownGoogleLogging();
  return retval;
}
