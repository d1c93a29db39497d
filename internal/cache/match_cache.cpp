#include "internal/cache/match_cache.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"

namespace dispatch::cache {

MatchCache::MatchCache(std::shared_ptr<KeyValueCache> kv, std::chrono::seconds match_ttl, std::chrono::seconds claim_ttl)
    : kv_(std::move(kv)), match_ttl_(match_ttl), claim_ttl_(claim_ttl) {
}

std::string MatchCache::MatchKey(const std::string& delivery_id) {
  return "match:" + delivery_id;
}

std::string MatchCache::ClaimKey(std::string_view scope, const std::string& id) {
  return "claim:" + std::string(scope) + ":" + id;
}

void MatchCache::Put(const dispatch::v1::MatchRecord& record) {
  if (record.delivery_id().empty()) {
    throw util::InvalidArgument("match record requires delivery_id");
  }
  kv_->Set(MatchKey(record.delivery_id()), util::ToJson(record), match_ttl_);
}

std::optional<dispatch::v1::MatchRecord> MatchCache::Get(const std::string& delivery_id) {
  auto json = kv_->Get(MatchKey(delivery_id));
  if (!json) return std::nullopt;

  dispatch::v1::MatchRecord record;
  try {
    util::FromJson(*json, &record);
  } catch (const util::InvalidArgument& e) {
    DISPATCH_LOG_ERROR("Dropping unreadable match record",
                       {observability::DeliveryField(delivery_id), observability::ErrorField(e.what())});
    kv_->Delete(MatchKey(delivery_id));
    return std::nullopt;
  }
  return record;
}

bool MatchCache::Delete(const std::string& delivery_id) {
  return kv_->Delete(MatchKey(delivery_id));
}

bool MatchCache::Claim(std::string_view scope, const std::string& id) {
  return kv_->SetIfAbsent(ClaimKey(scope, id), "1", claim_ttl_);
}

void MatchCache::Release(std::string_view scope, const std::string& id) {
  kv_->Delete(ClaimKey(scope, id));
}

} // namespace dispatch::cache
