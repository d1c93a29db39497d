#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace dispatch::bus {

/*
  Broker session.

  Exchanges are fanout: every queue bound at publish time receives its own
  copy. Queues are exclusive to the session that declared them. A message
  published with an expiration is discarded if it is still queued when the
  expiration elapses.

  All operations throw util::Unavailable once the session is closed.
*/
class Broker {
 public:
  virtual ~Broker() = default;

  virtual void Open()         = 0;
  virtual void Close()        = 0;
  virtual bool IsOpen() const = 0;

  // Idempotent.
  virtual void AssertExchange(const std::string& exchange) = 0;

  // Returns the generated queue name.
  virtual std::string DeclareQueue() = 0;

  virtual void Bind(const std::string& queue, const std::string& exchange) = 0;

  // Throws util::NotFound for an exchange that was never asserted.
  virtual void Publish(const std::string& exchange, const std::string& payload, std::optional<std::chrono::milliseconds> expiration) = 0;

  // Blocks for the next unexpired message. Returns nullopt once the queue is
  // deleted or the session closes.
  virtual std::optional<std::string> Consume(const std::string& queue) = 0;

  // Wakes any blocked Consume() on the queue.
  virtual void DeleteQueue(const std::string& queue) = 0;
};

} // namespace dispatch::bus
