#include "internal/core/pricing.hpp"

#include <cmath>

#include "config/config.pb.h"
#include "internal/core/eta.hpp"

namespace dispatch::core {

namespace {

VehicleProfile Merge(const dispatch::runtime::config::VehicleProfile& configured, VehicleProfile profile) {
  if (configured.speed_kmh() > 0) profile.speed_kmh = configured.speed_kmh();
  if (configured.price_per_km() > 0) profile.price_per_km = configured.price_per_km();
  return profile;
}

} // namespace

PricingTable::PricingTable() = default;

PricingTable::PricingTable(const dispatch::runtime::config::PricingConfig& config)
    : bike_(Merge(config.bike(), kDefaultBikeProfile)),
      car_(Merge(config.car(), kDefaultCarProfile)),
      bus_(Merge(config.bus(), kDefaultBusProfile)),
      fallback_(Merge(config.fallback(), kDefaultFallbackProfile)) {
}

const VehicleProfile& PricingTable::ProfileFor(dispatch::v1::VehicleType type) const {
  switch (type) {
    case dispatch::v1::VEHICLE_TYPE_BIKE:
      return bike_;
    case dispatch::v1::VEHICLE_TYPE_CAR:
      return car_;
    case dispatch::v1::VEHICLE_TYPE_BUS:
      return bus_;
    default:
      return fallback_;
  }
}

double RoundTo2(double value) {
  return std::round(value * 100.0) / 100.0;
}

double ComputeDeliveryFee(double distance_km, const VehicleProfile& profile) {
  return RoundTo2(distance_km) * profile.price_per_km;
}

TripQuote QuoteTrip(const PricingTable& pricing, const geo::Coordinates& origin, const geo::Coordinates& destination,
                    dispatch::v1::VehicleType vehicle_type) {
  const auto& profile = pricing.ProfileFor(vehicle_type);

  TripQuote quote;
  quote.distance_km             = geo::MetersToKm(geo::HaversineMeters(origin, destination));
  quote.delivery_fee            = ComputeDeliveryFee(quote.distance_km, profile);
  quote.estimated_delivery_time = FormatDeliveryTime(SplitHours(TravelHours(quote.distance_km, profile.speed_kmh)));
  return quote;
}

} // namespace dispatch::core
