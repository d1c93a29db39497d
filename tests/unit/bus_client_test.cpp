#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/bus/bus_client.hpp"
#include "internal/bus/exchanges.hpp"
#include "internal/bus/memory_broker.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"
#include "support/recording_connection.hpp"

namespace {

using dispatch::bus::BusClient;
using dispatch::bus::MemoryBroker;
using dispatch::testing::Eventually;

void TestPublishRequiresConnection() {
  BusClient bus(std::make_shared<MemoryBroker>());

  bool threw = false;
  try {
    bus.Publish(dispatch::bus::kPackageRequest, "{}");
  } catch (const dispatch::util::Unavailable&) {
    threw = true;
  }
  assert(threw);
  assert(!bus.IsConnected());
}

void TestEverySubscriberReceivesEachMessage() {
  BusClient bus(std::make_shared<MemoryBroker>());
  bus.Connect();

  std::atomic<int> first{0};
  std::atomic<int> second{0};
  bus.Subscribe(dispatch::bus::kDriverResponses, [&](const std::string&) { ++first; });
  bus.Subscribe(dispatch::bus::kDriverResponses, [&](const std::string&) { ++second; });

  bus.Publish(dispatch::bus::kDriverResponses, "a");
  bus.Publish(dispatch::bus::kDriverResponses, "b");

  assert(Eventually([&] { return first == 2 && second == 2; }));
  bus.Disconnect();
}

void TestHandlerFailureDoesNotStopConsumer() {
  BusClient bus(std::make_shared<MemoryBroker>());
  bus.Connect();

  std::mutex               mutex;
  std::vector<std::string> seen;
  bus.Subscribe(dispatch::bus::kPackageRequest, [&](const std::string& payload) {
    if (payload == "poison") throw std::runtime_error("cannot decode");
    std::lock_guard lock(mutex);
    seen.push_back(payload);
  });

  bus.Publish(dispatch::bus::kPackageRequest, "poison");
  bus.Publish(dispatch::bus::kPackageRequest, "good");

  assert(Eventually([&] {
    std::lock_guard lock(mutex);
    return seen.size() == 1;
  }));
  assert(seen[0] == "good");
  bus.Disconnect();
}

void TestPublishMessageEncodesProtoJson() {
  BusClient bus(std::make_shared<MemoryBroker>());
  bus.Connect();

  std::mutex                   mutex;
  dispatch::v1::DriverResponse received;
  std::atomic<bool>            done{false};
  bus.Subscribe(dispatch::bus::kDriverResponses, [&](const std::string& payload) {
    std::lock_guard lock(mutex);
    dispatch::util::FromJson(payload, &received);
    done = true;
  });

  dispatch::v1::DriverResponse response;
  response.set_rider_id("rider-1");
  response.set_customer_id("customer-1");
  response.set_delivery_id("d1");
  response.set_availability(true);
  response.set_arrival_time("5 minutes");
  bus.PublishMessage(dispatch::bus::kDriverResponses, response);

  assert(Eventually([&] { return done.load(); }));
  std::lock_guard lock(mutex);
  assert(received.rider_id() == "rider-1");
  assert(received.availability());
  assert(received.arrival_time() == "5 minutes");
  bus.Disconnect();
}

void TestDisconnectIsIdempotentAndStopsConsumers() {
  auto      broker = std::make_shared<MemoryBroker>();
  BusClient bus(broker);
  bus.Connect();
  bus.Subscribe(dispatch::bus::kAssignedPackageRequests, [](const std::string&) {});

  bus.Disconnect();
  bus.Disconnect();

  assert(!bus.IsConnected());
  assert(!broker->IsOpen());
}

void TestSubscribeRacingDisconnectLeavesNoConsumer() {
  for (int round = 0; round < 50; ++round) {
    auto broker = std::make_shared<MemoryBroker>();
    auto bus    = std::make_unique<BusClient>(broker);
    bus->Connect();

    std::atomic<bool> refused{false};
    std::thread       subscriber([&] {
      for (;;) {
        try {
          bus->Subscribe(dispatch::bus::kDriverResponses, [](const std::string&) {});
        } catch (const dispatch::util::Unavailable&) {
          refused = true;
          return;
        }
      }
    });

    bus->Disconnect();
    subscriber.join();
    assert(refused);

    // destroying the client must not find a live consumer thread
    bus.reset();
    assert(!broker->IsOpen());
  }
}

} // namespace

int main() {
  TestPublishRequiresConnection();
  TestEverySubscriberReceivesEachMessage();
  TestHandlerFailureDoesNotStopConsumer();
  TestPublishMessageEncodesProtoJson();
  TestDisconnectIsIdempotentAndStopsConsumers();
  TestSubscribeRacingDisconnectLeavesNoConsumer();

  std::cout << "dispatch_unit_bus_client: pass\n";
  return 0;
}
