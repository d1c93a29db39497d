#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <unordered_map>
#include <unordered_set>

#include "internal/bus/broker.hpp"
#include "internal/util/time.hpp"

namespace dispatch::bus {

/*
  In-process fanout broker.

  queue_capacity bounds each queue (0 = unbounded); when full the oldest
  message is dropped, like a max-length queue.
*/
class MemoryBroker final : public Broker {
 public:
  explicit MemoryBroker(std::size_t queue_capacity = 0);

  void Open() override;
  void Close() override;
  bool IsOpen() const override;

  void        AssertExchange(const std::string& exchange) override;
  std::string DeclareQueue() override;
  void        Bind(const std::string& queue, const std::string& exchange) override;
  void        Publish(const std::string& exchange, const std::string& payload, std::optional<std::chrono::milliseconds> expiration) override;

  std::optional<std::string> Consume(const std::string& queue) override;
  void                       DeleteQueue(const std::string& queue) override;

  // Messages currently held by the queue, expired ones included.
  std::size_t Depth(const std::string& queue) const;

 private:
  struct Envelope {
    std::string                                  payload;
    std::optional<util::SteadyClock::time_point> expires_at;
  };

  struct Queue {
    std::deque<Envelope> messages;
    bool                 deleted = false;
  };

  void RequireOpen() const;

  std::size_t queue_capacity_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    open_ = false;

  std::unordered_set<std::string>                            exchanges_;
  std::unordered_map<std::string, std::set<std::string>>     bindings_; // exchange -> queues
  std::unordered_map<std::string, std::shared_ptr<Queue>>    queues_;
};

} // namespace dispatch::bus
