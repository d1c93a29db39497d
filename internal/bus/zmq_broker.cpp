#include "internal/bus/zmq_broker.hpp"

#include <cerrno>
#include <charconv>
#include <cstdint>
#include <iterator>
#include <vector>

#include <zmq_addon.hpp>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace dispatch::bus {

namespace {

constexpr std::size_t kFrameCount = 3;

std::uint64_t ParseDeadline(const zmq::message_t& frame) {
  const auto*   begin    = static_cast<const char*>(frame.data());
  std::uint64_t deadline = 0;
  std::from_chars(begin, begin + frame.size(), deadline);
  return deadline;
}

} // namespace

ZmqBroker::ZmqBroker(ZmqEndpoints endpoints, std::size_t queue_capacity, std::chrono::milliseconds poll_interval)
    : endpoints_(std::move(endpoints)), queue_capacity_(queue_capacity), poll_interval_(poll_interval) {
}

ZmqBroker::~ZmqBroker() {
  Close();
}

void ZmqBroker::RequireOpen() const {
  if (!open_) throw util::Unavailable("broker session is closed");
}

void ZmqBroker::Open() {
  std::scoped_lock lock(mutex_, publish_mutex_);
  if (open_) return;

  try {
    auto publisher = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::pub);
    publisher->set(zmq::sockopt::linger, 0);
    publisher->connect(endpoints_.publish_endpoint);
    publisher_ = std::move(publisher);
  } catch (const zmq::error_t& e) {
    throw util::Unavailable("cannot connect publisher to " + endpoints_.publish_endpoint + ": " + e.what());
  }

  open_ = true;
  DISPATCH_LOG_INFO("ZeroMQ bus connected", {observability::StringField("publish_endpoint", endpoints_.publish_endpoint),
                                             observability::StringField("subscribe_endpoint", endpoints_.subscribe_endpoint)});
}

void ZmqBroker::Close() {
  std::unordered_map<std::string, std::shared_ptr<Queue>> queues;
  {
    std::scoped_lock lock(mutex_, publish_mutex_);
    open_ = false;
    for (auto& [_, queue] : queues_) queue->deleted = true;
    queues.swap(queues_);
    exchanges_.clear();
    publisher_.reset();
  }
  // a queue still being consumed closes its socket on the consumer thread
}

bool ZmqBroker::IsOpen() const {
  std::lock_guard lock(mutex_);
  return open_;
}

void ZmqBroker::AssertExchange(const std::string& exchange) {
  std::lock_guard lock(mutex_);
  RequireOpen();
  exchanges_.insert(exchange);
}

std::string ZmqBroker::DeclareQueue() {
  std::lock_guard lock(mutex_);
  RequireOpen();

  auto queue = std::make_shared<Queue>(context_);
  try {
    queue->socket.set(zmq::sockopt::linger, 0);
    queue->socket.set(zmq::sockopt::rcvtimeo, static_cast<int>(poll_interval_.count()));
    if (queue_capacity_ > 0) queue->socket.set(zmq::sockopt::rcvhwm, static_cast<int>(queue_capacity_));
    queue->socket.connect(endpoints_.subscribe_endpoint);
  } catch (const zmq::error_t& e) {
    throw util::Unavailable("cannot connect subscriber to " + endpoints_.subscribe_endpoint + ": " + e.what());
  }

  auto name     = "zmq.sub-" + util::NewId();
  queues_[name] = std::move(queue);
  return name;
}

void ZmqBroker::Bind(const std::string& queue_name, const std::string& exchange) {
  std::lock_guard lock(mutex_);
  RequireOpen();

  if (!exchanges_.contains(exchange)) throw util::NotFound("no exchange " + exchange);
  auto it = queues_.find(queue_name);
  if (it == queues_.end()) throw util::NotFound("no queue " + queue_name);

  auto& queue = *it->second;
  if (!queue.exchanges.insert(exchange).second) return;
  try {
    queue.socket.set(zmq::sockopt::subscribe, exchange);
  } catch (const zmq::error_t& e) {
    throw util::Unavailable("cannot subscribe to " + exchange + ": " + e.what());
  }
}

void ZmqBroker::Publish(const std::string& exchange, const std::string& payload, std::optional<std::chrono::milliseconds> expiration) {
  {
    std::lock_guard lock(mutex_);
    RequireOpen();
    if (!exchanges_.contains(exchange)) throw util::NotFound("no exchange " + exchange);
  }

  const auto deadline = expiration ? std::to_string(util::NowMillis() + static_cast<std::uint64_t>(expiration->count())) : std::string("0");

  std::lock_guard lock(publish_mutex_);
  if (!publisher_) throw util::Unavailable("broker session is closed");

  const std::vector<zmq::const_buffer> frames = {zmq::buffer(exchange), zmq::buffer(deadline), zmq::buffer(payload)};
  try {
    if (!zmq::send_multipart(*publisher_, frames)) throw util::Unavailable("publish to " + exchange + " would block");
  } catch (const zmq::error_t& e) {
    throw util::Unavailable("publish to " + exchange + " failed: " + e.what());
  }
}

std::optional<std::string> ZmqBroker::Consume(const std::string& queue_name) {
  std::shared_ptr<Queue> queue;
  {
    std::lock_guard lock(mutex_);
    auto            it = queues_.find(queue_name);
    if (it == queues_.end()) return std::nullopt;
    queue = it->second;
  }

  while (!queue->deleted) {
    std::vector<zmq::message_t> frames;
    try {
      // empty result means the poll interval elapsed
      if (!zmq::recv_multipart(queue->socket, std::back_inserter(frames))) continue;
    } catch (const zmq::error_t& e) {
      if (e.num() == ETERM) return std::nullopt;
      throw util::Unavailable(std::string("receive failed: ") + e.what());
    }

    if (frames.size() != kFrameCount) {
      DISPATCH_LOG_WARN("Dropped malformed bus message", {observability::StringField("queue", queue_name),
                                                          observability::IntField("frames", static_cast<std::int64_t>(frames.size()))});
      continue;
    }

    // SUB filters by prefix; exchanges match exactly
    if (!queue->exchanges.contains(frames[0].to_string())) continue;

    const auto deadline = ParseDeadline(frames[1]);
    if (deadline != 0 && deadline <= util::NowMillis()) continue;

    return frames[2].to_string();
  }
  return std::nullopt;
}

void ZmqBroker::DeleteQueue(const std::string& queue_name) {
  std::shared_ptr<Queue> queue;
  {
    std::lock_guard lock(mutex_);
    auto            it = queues_.find(queue_name);
    if (it == queues_.end()) return;
    queue = std::move(it->second);
    queues_.erase(it);
  }
  // Consume() notices within one poll interval
  queue->deleted = true;
}

// ------------------------------------------------------------------
// Forwarder
// ------------------------------------------------------------------

ZmqProxy::ZmqProxy(std::string frontend_bind, std::string backend_bind)
    : frontend_bind_(std::move(frontend_bind)),
      backend_bind_(std::move(backend_bind)),
      frontend_(context_, zmq::socket_type::xsub),
      backend_(context_, zmq::socket_type::xpub) {
}

ZmqProxy::~ZmqProxy() {
  Stop();
}

void ZmqProxy::Start() {
  try {
    frontend_.set(zmq::sockopt::linger, 0);
    backend_.set(zmq::sockopt::linger, 0);
    frontend_.bind(frontend_bind_);
    backend_.bind(backend_bind_);
  } catch (const zmq::error_t& e) {
    throw util::Unavailable("cannot bind bus forwarder: " + std::string(e.what()));
  }

  thread_ = std::thread([this] {
    try {
      zmq::proxy(frontend_, backend_);
    } catch (const zmq::error_t& e) {
      if (e.num() != ETERM) DISPATCH_LOG_ERROR("Bus forwarder stopped", {observability::ErrorField(e.what())});
    }
  });

  DISPATCH_LOG_INFO("Bus forwarder started",
                    {observability::StringField("frontend", frontend_bind_), observability::StringField("backend", backend_bind_)});
}

void ZmqProxy::Stop() {
  if (stopped_) return;
  stopped_ = true;

  // interrupts zmq::proxy with ETERM
  context_.shutdown();
  if (thread_.joinable()) thread_.join();
}

} // namespace dispatch::bus
