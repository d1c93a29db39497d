#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace dispatch::cache {

/*
  Short-TTL key/value store.

  A ttl of zero means the entry never expires. Expired entries behave as
  absent for every operation.
*/
class KeyValueCache {
 public:
  virtual ~KeyValueCache() = default;

  virtual std::optional<std::string> Get(const std::string& key) = 0;

  virtual void Set(const std::string& key, std::string value, std::chrono::seconds ttl) = 0;

  // Stores only when no live entry exists. Returns true when this call stored the value.
  virtual bool SetIfAbsent(const std::string& key, std::string value, std::chrono::seconds ttl) = 0;

  // Returns true when a live entry was removed.
  virtual bool Delete(const std::string& key) = 0;
};

} // namespace dispatch::cache
