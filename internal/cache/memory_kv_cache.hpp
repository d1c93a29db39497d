#pragma once

#include <functional>
#include <shared_mutex>
#include <unordered_map>

#include "internal/cache/kv_cache.hpp"
#include "internal/util/time.hpp"

namespace dispatch::cache {

/*
  In-process KeyValueCache.

  Expiry is evaluated lazily against the injected clock. Every
  kPurgeInterval writes also sweep out all expired entries, so keys that
  are never touched again do not accumulate.
*/
class MemoryKeyValueCache final : public KeyValueCache {
 public:
  using NowFn = std::function<util::SteadyClock::time_point()>;

  static constexpr std::size_t kPurgeInterval = 128;

  MemoryKeyValueCache();
  explicit MemoryKeyValueCache(NowFn now);

  std::optional<std::string> Get(const std::string& key) override;
  void                       Set(const std::string& key, std::string value, std::chrono::seconds ttl) override;
  bool                       SetIfAbsent(const std::string& key, std::string value, std::chrono::seconds ttl) override;
  bool                       Delete(const std::string& key) override;

  // Drops every expired entry; returns how many were removed.
  std::size_t PurgeExpired();

  // Entries held, expired ones not yet swept included.
  std::size_t Size() const;

 private:
  struct Entry {
    std::string                                  value;
    std::optional<util::SteadyClock::time_point> expires_at;
  };

  bool  IsLive(const Entry& entry, util::SteadyClock::time_point now) const;
  Entry MakeEntry(std::string value, std::chrono::seconds ttl) const;

  // Caller holds mutex_ exclusively.
  std::size_t PurgeExpiredLocked(util::SteadyClock::time_point now);
  void        CountWriteLocked(util::SteadyClock::time_point now);

  NowFn now_;

  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Entry> entries_;
  std::size_t                            writes_since_purge_ = 0;
};

} // namespace dispatch::cache
