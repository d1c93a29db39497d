#include "internal/bus/memory_broker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace dispatch::bus {

MemoryBroker::MemoryBroker(std::size_t queue_capacity) : queue_capacity_(queue_capacity) {
}

void MemoryBroker::RequireOpen() const {
  if (!open_) throw util::Unavailable("broker session is closed");
}

void MemoryBroker::Open() {
  std::lock_guard lock(mutex_);
  open_ = true;
}

void MemoryBroker::Close() {
  {
    std::lock_guard lock(mutex_);
    open_ = false;
    for (auto& [_, queue] : queues_) queue->deleted = true;
    queues_.clear();
    bindings_.clear();
    exchanges_.clear();
  }
  cv_.notify_all();
}

bool MemoryBroker::IsOpen() const {
  std::lock_guard lock(mutex_);
  return open_;
}

void MemoryBroker::AssertExchange(const std::string& exchange) {
  std::lock_guard lock(mutex_);
  RequireOpen();
  exchanges_.insert(exchange);
}

std::string MemoryBroker::DeclareQueue() {
  std::lock_guard lock(mutex_);
  RequireOpen();

  auto name     = "amq.gen-" + util::NewId();
  queues_[name] = std::make_shared<Queue>();
  return name;
}

void MemoryBroker::Bind(const std::string& queue, const std::string& exchange) {
  std::lock_guard lock(mutex_);
  RequireOpen();

  if (!exchanges_.contains(exchange)) throw util::NotFound("no exchange " + exchange);
  if (!queues_.contains(queue)) throw util::NotFound("no queue " + queue);
  bindings_[exchange].insert(queue);
}

void MemoryBroker::Publish(const std::string& exchange, const std::string& payload, std::optional<std::chrono::milliseconds> expiration) {
  {
    std::lock_guard lock(mutex_);
    RequireOpen();

    if (!exchanges_.contains(exchange)) throw util::NotFound("no exchange " + exchange);

    Envelope envelope{payload, std::nullopt};
    if (expiration) envelope.expires_at = util::SteadyClock::now() + *expiration;

    auto it = bindings_.find(exchange);
    if (it == bindings_.end()) return;

    for (const auto& name : it->second) {
      auto queue = queues_.find(name);
      if (queue == queues_.end()) continue;

      auto& messages = queue->second->messages;
      if (queue_capacity_ > 0 && messages.size() >= queue_capacity_) {
        messages.pop_front();
        DISPATCH_LOG_WARN("Queue full, dropped oldest message",
                          {observability::ExchangeField(exchange), observability::StringField("queue", name)});
      }
      messages.push_back(envelope);
    }
  }
  cv_.notify_all();
}

std::optional<std::string> MemoryBroker::Consume(const std::string& queue_name) {
  std::unique_lock lock(mutex_);

  auto it = queues_.find(queue_name);
  if (it == queues_.end()) return std::nullopt;
  auto queue = it->second;

  for (;;) {
    cv_.wait(lock, [&] { return queue->deleted || !queue->messages.empty(); });
    if (queue->deleted) return std::nullopt;

    auto envelope = std::move(queue->messages.front());
    queue->messages.pop_front();

    if (envelope.expires_at && *envelope.expires_at <= util::SteadyClock::now()) continue;
    return std::move(envelope.payload);
  }
}

void MemoryBroker::DeleteQueue(const std::string& queue_name) {
  {
    std::lock_guard lock(mutex_);

    auto it = queues_.find(queue_name);
    if (it == queues_.end()) return;

    it->second->deleted = true;
    queues_.erase(it);
    for (auto& [_, queues] : bindings_) queues.erase(queue_name);
  }
  cv_.notify_all();
}

std::size_t MemoryBroker::Depth(const std::string& queue_name) const {
  std::lock_guard lock(mutex_);

  auto it = queues_.find(queue_name);
  return it == queues_.end() ? 0 : it->second->messages.size();
}

} // namespace dispatch::bus
