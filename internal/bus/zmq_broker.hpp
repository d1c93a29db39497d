#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include <zmq.hpp>

#include "internal/bus/broker.hpp"

namespace dispatch::bus {

struct ZmqEndpoints {
  // Forwarder XSUB side; every node publishes here.
  std::string publish_endpoint;
  // Forwarder XPUB side; every queue subscribes here.
  std::string subscribe_endpoint;
};

/*
  Broker over ZeroMQ PUB/SUB.

  Each node connects one PUB socket to a shared forwarder and one SUB
  socket per declared queue, so every queue bound to an exchange on any
  node receives its own copy of a publish. A message is three frames:

    [exchange][expires_at unix ms, "0" for none][payload]

  Expired messages are dropped on receipt. A SUB socket only starts
  receiving once its subscription reaches the publisher, so like any
  fanout exchange a queue sees nothing published before it was bound.

  Bind() must be called before the first Consume() on that queue; the
  queue's socket then belongs to the consuming thread. queue_capacity is
  the receive high-water mark (0 = unbounded).
*/
class ZmqBroker final : public Broker {
 public:
  ZmqBroker(ZmqEndpoints endpoints, std::size_t queue_capacity = 0,
            std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));
  ~ZmqBroker() override;

  void Open() override;
  void Close() override;
  bool IsOpen() const override;

  void        AssertExchange(const std::string& exchange) override;
  std::string DeclareQueue() override;
  void        Bind(const std::string& queue, const std::string& exchange) override;
  void        Publish(const std::string& exchange, const std::string& payload, std::optional<std::chrono::milliseconds> expiration) override;

  std::optional<std::string> Consume(const std::string& queue) override;
  void                       DeleteQueue(const std::string& queue) override;

 private:
  struct Queue {
    explicit Queue(zmq::context_t& context) : socket(context, zmq::socket_type::sub) {
    }

    zmq::socket_t         socket;
    std::set<std::string> exchanges;
    std::atomic<bool>     deleted{false};
  };

  void RequireOpen() const;

  ZmqEndpoints              endpoints_;
  std::size_t               queue_capacity_;
  std::chrono::milliseconds poll_interval_;

  zmq::context_t context_;

  mutable std::mutex                                      mutex_;
  bool                                                    open_ = false;
  std::unordered_set<std::string>                         exchanges_;
  std::unordered_map<std::string, std::shared_ptr<Queue>> queues_;

  // PUB sockets are not thread-safe.
  std::mutex                     publish_mutex_;
  std::unique_ptr<zmq::socket_t> publisher_;
};

/*
  XSUB/XPUB forwarder that joins the publishers and subscribers of every
  node. One process in a deployment runs it.
*/
class ZmqProxy {
 public:
  ZmqProxy(std::string frontend_bind, std::string backend_bind);
  ~ZmqProxy();

  ZmqProxy(const ZmqProxy&)            = delete;
  ZmqProxy& operator=(const ZmqProxy&) = delete;

  // Binds both sides and starts forwarding. Throws util::Unavailable when a bind fails.
  void Start();
  void Stop();

 private:
  std::string frontend_bind_;
  std::string backend_bind_;

  zmq::context_t context_;
  zmq::socket_t  frontend_;
  zmq::socket_t  backend_;
  std::thread    thread_;
  bool           stopped_ = false;
};

} // namespace dispatch::bus
