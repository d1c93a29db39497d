#include "internal/core/rider_discovery.hpp"

#include "internal/cache/match_cache.hpp"
#include "internal/core/eta.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace dispatch::core {

namespace {

void FillRiderSnapshot(const db::model::RiderRecord& rider, const geo::Coordinates& location, dispatch::v1::RiderSnapshot* out) {
  out->set_rider_id(rider.id);
  out->mutable_location()->set_latitude(location.latitude);
  out->mutable_location()->set_longitude(location.longitude);
  out->set_phone(rider.phone);
  out->set_email(rider.email);
  out->set_status(rider.status);
  out->set_first_name(rider.first_name);
  out->set_last_name(rider.last_name);
  out->set_gender(rider.gender);
}

} // namespace

RiderDiscovery::RiderDiscovery(std::shared_ptr<db::Repository> repository, std::shared_ptr<cache::MatchCache> matches, PricingTable pricing,
                               const dispatch::runtime::config::DiscoveryConfig& config)
    : repository_(std::move(repository)),
      matches_(std::move(matches)),
      pricing_(pricing),
      max_distance_m_(config.max_distance_m() > 0 ? config.max_distance_m() : kDefaultMaxDistanceMeters),
      eta_mode_(config.eta_mode()) {
}

dispatch::v1::MatchRecord RiderDiscovery::FindRider(const std::string& customer_id) {
  if (customer_id.empty()) {
    throw util::InvalidArgument("find rider: customer_id is required");
  }

  auto tx = repository_->Begin();

  const auto deliveries = repository_->ListDeliveriesByCustomer(*tx, customer_id);
  if (deliveries.empty()) {
    throw util::NotFound("find rider: no delivery for customer " + customer_id);
  }
  const auto& delivery = deliveries.back();

  const auto nearby = repository_->FindRidersNear(*tx, delivery.sender_location, max_distance_m_);
  if (nearby.empty()) {
    throw util::NotFound("find rider: no rider within range of delivery " + delivery.id);
  }

  std::optional<db::model::RiderRecord> selected;
  geo::Coordinates                      selected_location;
  std::vector<CandidateLeg>             legs;
  legs.reserve(nearby.size());

  for (const auto& candidate : nearby) {
    const auto vehicle = repository_->GetVehicleByRider(*tx, candidate.rider_id);
    const auto& profile = vehicle ? pricing_.ProfileFor(vehicle->vehicle_type) : pricing_.Fallback();
    legs.push_back({candidate.rider_id, geo::MetersToKm(candidate.distance_m), profile.speed_kmh});

    if (selected) continue;

    auto rider = repository_->GetRider(*tx, candidate.rider_id);
    if (rider && rider->status == dispatch::v1::RIDER_STATUS_ONLINE && rider->active) {
      selected          = std::move(rider);
      selected_location = candidate.location;
    }
  }
  tx->Commit();

  if (!selected) {
    throw util::NotFound("find rider: no available rider near delivery " + delivery.id);
  }

  const auto arrival = ArrivalMinutes(AggregateTravelHours(legs, selected->id, eta_mode_));

  dispatch::v1::MatchRecord match;
  match.set_delivery_id(delivery.id);
  FillRiderSnapshot(*selected, selected_location, match.mutable_rider());
  match.set_customer_id(delivery.customer_id);
  match.set_sender_name(delivery.sender_name);
  match.set_sender_address(delivery.sender_address);
  match.set_recipient_address(delivery.recipient_address);
  match.set_estimated_delivery_time(delivery.estimated_delivery_time);
  match.set_delivery_ref_number(delivery.delivery_ref_number);
  match.set_arrival_minutes(arrival);
  match.set_delivery_fee(delivery.delivery_fee);
  match.set_match_id(util::NewId());

  matches_->Put(match);

  DISPATCH_LOG_INFO("Rider found", {observability::DeliveryField(delivery.id), observability::RiderField(selected->id),
                                    observability::IntField("candidates", static_cast<std::int64_t>(nearby.size())),
                                    observability::IntField("arrival_minutes", arrival)});
  return match;
}

} // namespace dispatch::core
