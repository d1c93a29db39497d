#include "internal/cache/memory_kv_cache.hpp"

#include <mutex>

namespace dispatch::cache {

MemoryKeyValueCache::MemoryKeyValueCache() : MemoryKeyValueCache([] { return util::SteadyClock::now(); }) {
}

MemoryKeyValueCache::MemoryKeyValueCache(NowFn now) : now_(std::move(now)) {
}

bool MemoryKeyValueCache::IsLive(const Entry& entry, util::SteadyClock::time_point now) const {
  return !entry.expires_at || *entry.expires_at > now;
}

MemoryKeyValueCache::Entry MemoryKeyValueCache::MakeEntry(std::string value, std::chrono::seconds ttl) const {
  Entry entry{std::move(value), std::nullopt};
  if (ttl.count() > 0) entry.expires_at = now_() + ttl;
  return entry;
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<std::string> MemoryKeyValueCache::Get(const std::string& key) {
  std::shared_lock lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end() || !IsLive(it->second, now_())) return std::nullopt;
  return it->second.value;
}

// ------------------------------------------------------------
// Set
// ------------------------------------------------------------

void MemoryKeyValueCache::Set(const std::string& key, std::string value, std::chrono::seconds ttl) {
  auto             entry = MakeEntry(std::move(value), ttl);
  std::unique_lock lock(mutex_);
  entries_[key] = std::move(entry);
  CountWriteLocked(now_());
}

bool MemoryKeyValueCache::SetIfAbsent(const std::string& key, std::string value, std::chrono::seconds ttl) {
  std::unique_lock lock(mutex_);

  const auto now = now_();
  auto       it  = entries_.find(key);
  if (it != entries_.end() && IsLive(it->second, now)) return false;

  entries_[key] = MakeEntry(std::move(value), ttl);
  CountWriteLocked(now);
  return true;
}

// ------------------------------------------------------------
// Delete
// ------------------------------------------------------------

bool MemoryKeyValueCache::Delete(const std::string& key) {
  std::unique_lock lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end()) return false;

  const bool live = IsLive(it->second, now_());
  entries_.erase(it);
  return live;
}

// ------------------------------------------------------------
// Expiry sweep
// ------------------------------------------------------------

std::size_t MemoryKeyValueCache::PurgeExpired() {
  std::unique_lock lock(mutex_);
  return PurgeExpiredLocked(now_());
}

std::size_t MemoryKeyValueCache::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

std::size_t MemoryKeyValueCache::PurgeExpiredLocked(util::SteadyClock::time_point now) {
  writes_since_purge_ = 0;

  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (IsLive(it->second, now)) {
      ++it;
      continue;
    }
    it = entries_.erase(it);
    ++removed;
  }
  return removed;
}

void MemoryKeyValueCache::CountWriteLocked(util::SteadyClock::time_point now) {
  if (++writes_since_purge_ >= kPurgeInterval) PurgeExpiredLocked(now);
}

} // namespace dispatch::cache
