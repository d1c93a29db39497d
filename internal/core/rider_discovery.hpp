#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "dispatch/v1/types.pb.h"
#include "internal/core/pricing.hpp"

namespace dispatch::cache {
class MatchCache;
}
namespace dispatch::db {
class Repository;
}

namespace dispatch::core {

inline constexpr double kDefaultMaxDistanceMeters = 1000000.0;

/*
  Finds the nearest eligible rider for a customer's latest delivery.

  Candidates come from a radius search around the sender, nearest first;
  the first one that is online and active wins, however close an
  ineligible rider is. The chosen rider and the delivery context are
  stored in the match cache under the delivery id.

  Throws util::NotFound when the customer has no delivery, nobody is in
  range, or no candidate is eligible.
*/
class RiderDiscovery {
 public:
  RiderDiscovery(std::shared_ptr<db::Repository> repository, std::shared_ptr<cache::MatchCache> matches, PricingTable pricing,
                 const dispatch::runtime::config::DiscoveryConfig& config);

  dispatch::v1::MatchRecord FindRider(const std::string& customer_id);

 private:
  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<cache::MatchCache> matches_;
  PricingTable                       pricing_;
  double                             max_distance_m_;
  dispatch::runtime::config::EtaMode eta_mode_;
};

} // namespace dispatch::core
