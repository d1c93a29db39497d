#include "internal/registry/connection_registry.hpp"

#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace dispatch::registry {

void ConnectionRegistry::Register(const std::string& identity, std::shared_ptr<Connection> connection) {
  std::size_t size = 0;
  {
    std::unique_lock lock(mutex_);
    connections_[identity] = std::move(connection);
    size                   = connections_.size();
  }
  observability::Metrics::Instance().SetLiveConnections(static_cast<std::int64_t>(size));
}

std::shared_ptr<Connection> ConnectionRegistry::Lookup(const std::string& identity) const {
  std::shared_lock lock(mutex_);

  auto it = connections_.find(identity);
  if (it == connections_.end()) return nullptr;
  return it->second;
}

std::optional<std::string> ConnectionRegistry::ReverseLookup(const std::string& connection_id) const {
  std::shared_lock lock(mutex_);

  for (const auto& [identity, connection] : connections_) {
    if (connection->Id() == connection_id) return identity;
  }
  return std::nullopt;
}

bool ConnectionRegistry::Send(const std::string& identity, const dispatch::v1::ServerEvent& event) const {
  auto connection = Lookup(identity);
  if (!connection) {
    DISPATCH_LOG_DEBUG("Dropping event for disconnected participant", {observability::StringField("identity", identity)});
    return false;
  }
  return connection->Send(event);
}

std::size_t ConnectionRegistry::Unregister(const Connection& connection) {
  std::size_t removed = 0;
  std::size_t size    = 0;
  {
    std::unique_lock lock(mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
      if (it->second.get() == &connection) {
        it = connections_.erase(it);
        ++removed;
        continue;
      }
      ++it;
    }
    size = connections_.size();
  }
  observability::Metrics::Instance().SetLiveConnections(static_cast<std::int64_t>(size));
  return removed;
}

std::size_t ConnectionRegistry::Size() const {
  std::shared_lock lock(mutex_);
  return connections_.size();
}

} // namespace dispatch::registry
