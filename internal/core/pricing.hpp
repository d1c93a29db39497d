#pragma once

#include <string>

#include "dispatch/v1/types.pb.h"
#include "internal/geo/geo.hpp"

namespace dispatch::runtime::config {
class PricingConfig;
}

namespace dispatch::core {

struct VehicleProfile {
  double speed_kmh    = 0.0;
  double price_per_km = 0.0;
};

inline constexpr VehicleProfile kDefaultBikeProfile{30.0, 50.0};
inline constexpr VehicleProfile kDefaultCarProfile{60.0, 100.0};
inline constexpr VehicleProfile kDefaultBusProfile{40.0, 80.0};
inline constexpr VehicleProfile kDefaultFallbackProfile{40.0, 80.0};

/*
  Speed and per-km price by vehicle type. Unset config values keep the
  defaults; an unknown or missing vehicle type uses the fallback profile.
*/
class PricingTable {
 public:
  PricingTable();
  explicit PricingTable(const dispatch::runtime::config::PricingConfig& config);

  const VehicleProfile& ProfileFor(dispatch::v1::VehicleType type) const;

  const VehicleProfile& Fallback() const {
    return fallback_;
  }

 private:
  VehicleProfile bike_     = kDefaultBikeProfile;
  VehicleProfile car_      = kDefaultCarProfile;
  VehicleProfile bus_      = kDefaultBusProfile;
  VehicleProfile fallback_ = kDefaultFallbackProfile;
};

// Half away from zero, to two decimals.
double RoundTo2(double value);

// Distance is rounded to two decimals before pricing.
double ComputeDeliveryFee(double distance_km, const VehicleProfile& profile);

struct TripQuote {
  double      distance_km  = 0.0;
  double      delivery_fee = 0.0;
  std::string estimated_delivery_time;
};

// Fee and travel time for the great-circle trip from origin to destination.
TripQuote QuoteTrip(const PricingTable& pricing, const geo::Coordinates& origin, const geo::Coordinates& destination,
                    dispatch::v1::VehicleType vehicle_type);

} // namespace dispatch::core
