#include "internal/cache/redis_kv_cache.hpp"

#include <sys/time.h>

#include <cstring>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dispatch::cache {

namespace {

timeval ToTimeval(std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec  = static_cast<decltype(tv.tv_sec)>(timeout.count() / 1000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>((timeout.count() % 1000) * 1000);
  return tv;
}

void AppendTtl(std::vector<std::string>& args, std::chrono::seconds ttl) {
  if (ttl.count() <= 0) return;
  args.emplace_back("EX");
  args.push_back(std::to_string(ttl.count()));
}

} // namespace

RedisKeyValueCache::RedisKeyValueCache(RedisOptions options) : options_(std::move(options)) {
  std::lock_guard lock(mutex_);
  ConnectLocked();
  DISPATCH_LOG_INFO("Redis cache connected", {observability::StringField("host", options_.host), observability::IntField("port", options_.port),
                                              observability::IntField("database", options_.database)});
}

std::string RedisKeyValueCache::Key(const std::string& key) const {
  return options_.key_prefix + key;
}

void RedisKeyValueCache::ConnectLocked() {
  context_.reset();

  const auto tv = ToTimeval(options_.timeout);
  ContextPtr context(redisConnectWithTimeout(options_.host.c_str(), options_.port, tv));
  if (!context) throw util::Unavailable("cannot allocate redis context");
  if (context->err) throw util::Unavailable("redis connect to " + options_.host + " failed: " + context->errstr);
  if (redisSetTimeout(context.get(), tv) != REDIS_OK) throw util::Unavailable("cannot set redis command timeout");

  context_ = std::move(context);

  if (!options_.password.empty()) SendLocked({"AUTH", options_.password});
  if (options_.database > 0) SendLocked({"SELECT", std::to_string(options_.database)});
}

RedisKeyValueCache::ReplyPtr RedisKeyValueCache::SendLocked(const std::vector<std::string>& args) {
  std::vector<const char*> argv;
  std::vector<std::size_t> argvlen;
  argv.reserve(args.size());
  argvlen.reserve(args.size());
  for (const auto& arg : args) {
    argv.push_back(arg.data());
    argvlen.push_back(arg.size());
  }

  ReplyPtr reply(static_cast<redisReply*>(redisCommandArgv(context_.get(), static_cast<int>(argv.size()), argv.data(), argvlen.data())));
  if (!reply) throw util::Unavailable(std::string("redis ") + args.front() + " failed: " + context_->errstr);
  if (reply->type == REDIS_REPLY_ERROR) throw util::Unavailable(std::string("redis ") + args.front() + " rejected: " + reply->str);
  return reply;
}

RedisKeyValueCache::ReplyPtr RedisKeyValueCache::Command(const std::vector<std::string>& args) {
  std::lock_guard lock(mutex_);

  if (context_ && !context_->err) {
    try {
      return SendLocked(args);
    } catch (const util::Unavailable& e) {
      // an error reply leaves the connection usable
      if (!context_->err) throw;
      DISPATCH_LOG_WARN("Redis connection lost, reconnecting", {observability::ErrorField(e.what())});
    }
  }

  ConnectLocked();
  return SendLocked(args);
}

std::optional<std::string> RedisKeyValueCache::Get(const std::string& key) {
  auto reply = Command({"GET", Key(key)});
  if (reply->type != REDIS_REPLY_STRING) return std::nullopt;
  return std::string(reply->str, reply->len);
}

void RedisKeyValueCache::Set(const std::string& key, std::string value, std::chrono::seconds ttl) {
  std::vector<std::string> args = {"SET", Key(key), std::move(value)};
  AppendTtl(args, ttl);
  Command(args);
}

bool RedisKeyValueCache::SetIfAbsent(const std::string& key, std::string value, std::chrono::seconds ttl) {
  std::vector<std::string> args = {"SET", Key(key), std::move(value), "NX"};
  AppendTtl(args, ttl);

  // nil when the key already exists
  auto reply = Command(args);
  return reply->type == REDIS_REPLY_STATUS && std::strcmp(reply->str, "OK") == 0;
}

bool RedisKeyValueCache::Delete(const std::string& key) {
  auto reply = Command({"DEL", Key(key)});
  return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

} // namespace dispatch::cache
