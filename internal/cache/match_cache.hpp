#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "dispatch/v1/types.pb.h"
#include "internal/cache/kv_cache.hpp"

namespace dispatch::cache {

/*
  Pending-match store.

  One record per delivery under "match:<delivery_id>", so concurrent
  matches never overwrite each other. Claims ("claim:<scope>:<id>") give
  at most one winner per ttl window across every process that shares the
  backing cache.
*/
class MatchCache {
 public:
  MatchCache(std::shared_ptr<KeyValueCache> kv, std::chrono::seconds match_ttl, std::chrono::seconds claim_ttl);

  // Throws util::InvalidArgument when the record has no delivery id.
  void Put(const dispatch::v1::MatchRecord& record);

  std::optional<dispatch::v1::MatchRecord> Get(const std::string& delivery_id);

  bool Delete(const std::string& delivery_id);

  bool Claim(std::string_view scope, const std::string& id);
  void Release(std::string_view scope, const std::string& id);

  static std::string MatchKey(const std::string& delivery_id);
  static std::string ClaimKey(std::string_view scope, const std::string& id);

 private:
  std::shared_ptr<KeyValueCache> kv_;
  std::chrono::seconds           match_ttl_;
  std::chrono::seconds           claim_ttl_;
};

// Claim scopes.
inline constexpr std::string_view kClaimSubmit   = "submit";
inline constexpr std::string_view kClaimNotify   = "notify";
inline constexpr std::string_view kClaimAssigned = "assigned";
inline constexpr std::string_view kClaimResponse = "response";
inline constexpr std::string_view kClaimRelay    = "relay";

} // namespace dispatch::cache
