#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/bus/broker.hpp"

namespace google::protobuf {
class Message;
}

namespace dispatch::bus {

/*
  Publish/subscribe client over one shared broker session.

  Subscribe() runs one consumer thread per subscription on an exclusive
  anonymous queue. Delivery is auto-ack: a handler that throws loses the
  message; the failure is logged and counted and the loop continues.

  Handlers must not call Disconnect().
*/
class BusClient {
 public:
  using Handler = std::function<void(const std::string& payload)>;

  explicit BusClient(std::shared_ptr<Broker> broker);
  ~BusClient();

  BusClient(const BusClient&)            = delete;
  BusClient& operator=(const BusClient&) = delete;

  // Throws util::Unavailable when the broker cannot be reached.
  void Connect();

  // Stops every consumer and closes the session. Safe to call twice.
  void Disconnect();

  bool IsConnected() const {
    return connected_;
  }

  void Publish(const std::string& exchange, const std::string& payload, std::optional<std::chrono::milliseconds> expiration = std::nullopt);

  // Encodes message as protobuf JSON.
  void PublishMessage(const std::string& exchange, const google::protobuf::Message& message,
                      std::optional<std::chrono::milliseconds> expiration = std::nullopt);

  void Subscribe(const std::string& exchange, Handler handler);

 private:
  struct Subscription {
    std::string exchange;
    std::string queue;
    Handler     handler;
    std::thread thread;
  };

  void RequireConnected() const;
  void ConsumeLoop(Subscription& subscription);

  std::shared_ptr<Broker> broker_;

  std::mutex                                 mutex_;
  std::vector<std::unique_ptr<Subscription>> subscriptions_;
  std::atomic<bool>                          connected_{false};
};

} // namespace dispatch::bus
