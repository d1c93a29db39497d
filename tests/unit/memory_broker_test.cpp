#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/bus/memory_broker.hpp"
#include "internal/util/errors.hpp"

namespace {

using dispatch::bus::MemoryBroker;

void TestFanoutToEveryBoundQueue() {
  MemoryBroker broker;
  broker.Open();
  broker.AssertExchange("package_request");

  const auto q1 = broker.DeclareQueue();
  const auto q2 = broker.DeclareQueue();
  assert(q1 != q2);
  assert(q1.rfind("amq.gen-", 0) == 0);

  broker.Bind(q1, "package_request");
  broker.Bind(q2, "package_request");
  broker.Publish("package_request", "hello", std::nullopt);

  assert(broker.Consume(q1) == std::optional<std::string>("hello"));
  assert(broker.Consume(q2) == std::optional<std::string>("hello"));
}

void TestQueueBoundAfterPublishMissesMessage() {
  MemoryBroker broker;
  broker.Open();
  broker.AssertExchange("driver_responses");
  broker.Publish("driver_responses", "early", std::nullopt);

  const auto q = broker.DeclareQueue();
  broker.Bind(q, "driver_responses");
  assert(broker.Depth(q) == 0);
}

void TestExpiredMessagesAreSkipped() {
  MemoryBroker broker;
  broker.Open();
  broker.AssertExchange("package_request");
  const auto q = broker.DeclareQueue();
  broker.Bind(q, "package_request");

  broker.Publish("package_request", "stale", std::chrono::milliseconds(1));
  broker.Publish("package_request", "fresh", std::nullopt);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  assert(broker.Consume(q) == std::optional<std::string>("fresh"));
}

void TestCapacityDropsOldest() {
  MemoryBroker broker(2);
  broker.Open();
  broker.AssertExchange("x");
  const auto q = broker.DeclareQueue();
  broker.Bind(q, "x");

  broker.Publish("x", "1", std::nullopt);
  broker.Publish("x", "2", std::nullopt);
  broker.Publish("x", "3", std::nullopt);

  assert(broker.Depth(q) == 2);
  assert(broker.Consume(q) == std::optional<std::string>("2"));
  assert(broker.Consume(q) == std::optional<std::string>("3"));
}

void TestUnknownExchangeAndClosedBroker() {
  MemoryBroker broker;

  bool unavailable = false;
  try {
    broker.AssertExchange("x");
  } catch (const dispatch::util::Unavailable&) {
    unavailable = true;
  }
  assert(unavailable);

  broker.Open();
  bool not_found = false;
  try {
    broker.Publish("never-asserted", "payload", std::nullopt);
  } catch (const dispatch::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestDeleteQueueWakesConsumer() {
  MemoryBroker broker;
  broker.Open();
  broker.AssertExchange("x");
  const auto q = broker.DeclareQueue();
  broker.Bind(q, "x");

  std::optional<std::string> result = std::string("unset");
  std::thread                consumer([&] { result = broker.Consume(q); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  broker.DeleteQueue(q);
  consumer.join();

  assert(!result.has_value());
  assert(!broker.Consume(q).has_value());
}

} // namespace

int main() {
  TestFanoutToEveryBoundQueue();
  TestQueueBoundAfterPublishMissesMessage();
  TestExpiredMessagesAreSkipped();
  TestCapacityDropsOldest();
  TestUnknownExchangeAndClosedBroker();
  TestDeleteQueueWakesConsumer();

  std::cout << "dispatch_unit_memory_broker: pass\n";
  return 0;
}
