#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <hiredis/hiredis.h>

#include "internal/cache/kv_cache.hpp"

namespace dispatch::cache {

struct RedisOptions {
  std::string               host = "127.0.0.1";
  int                       port = 6379;
  std::string               password;
  int                       database = 0;
  std::chrono::milliseconds timeout{1000};
  std::string               key_prefix = "dispatch:";
};

/*
  KeyValueCache on a Redis server, shared by every node.

  SetIfAbsent is SET NX so exactly one node wins a claim. Expiry is the
  server's. One synchronous connection serves all callers; a dropped
  connection is reopened once per command before the command fails with
  util::Unavailable.
*/
class RedisKeyValueCache final : public KeyValueCache {
 public:
  explicit RedisKeyValueCache(RedisOptions options);

  std::optional<std::string> Get(const std::string& key) override;
  void                       Set(const std::string& key, std::string value, std::chrono::seconds ttl) override;
  bool                       SetIfAbsent(const std::string& key, std::string value, std::chrono::seconds ttl) override;
  bool                       Delete(const std::string& key) override;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const {
      redisFree(context);
    }
  };
  struct ReplyDeleter {
    void operator()(redisReply* reply) const {
      freeReplyObject(reply);
    }
  };

  using ContextPtr = std::unique_ptr<redisContext, ContextDeleter>;
  using ReplyPtr   = std::unique_ptr<redisReply, ReplyDeleter>;

  std::string Key(const std::string& key) const;

  // Caller holds mutex_.
  void     ConnectLocked();
  ReplyPtr SendLocked(const std::vector<std::string>& args);

  ReplyPtr Command(const std::vector<std::string>& args);

  RedisOptions options_;

  std::mutex mutex_;
  ContextPtr context_;
};

} // namespace dispatch::cache
