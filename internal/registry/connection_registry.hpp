#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/registry/connection.hpp"

namespace dispatch::registry {

/*
  Participant identity -> live connection.

  Rider and customer identities share one key space. Register() replaces
  any previous connection for the identity. Unregister() removes only the
  identities still pointing at the given connection, so a reconnect that
  already replaced the entry is never evicted by the old session ending.
*/
class ConnectionRegistry {
 public:
  void Register(const std::string& identity, std::shared_ptr<Connection> connection);

  std::shared_ptr<Connection> Lookup(const std::string& identity) const;

  // Linear scan over all identities.
  std::optional<std::string> ReverseLookup(const std::string& connection_id) const;

  // Returns false when the identity has no connection or the send failed.
  bool Send(const std::string& identity, const dispatch::v1::ServerEvent& event) const;

  // Returns the number of identities removed.
  std::size_t Unregister(const Connection& connection);

  std::size_t Size() const;

 private:
  mutable std::shared_mutex                                    mutex_;
  std::unordered_map<std::string, std::shared_ptr<Connection>> connections_;
};

} // namespace dispatch::registry
