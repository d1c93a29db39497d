#include "internal/core/eta.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"

namespace dispatch::core {

double TravelHours(double distance_km, double speed_kmh) {
  if (speed_kmh <= 0) {
    throw util::InvalidArgument("travel time: speed must be positive");
  }
  if (distance_km < 0) {
    throw util::InvalidArgument("travel time: distance must not be negative");
  }
  return distance_km / speed_kmh;
}

TravelTime SplitHours(double hours) {
  TravelTime time;
  time.hours   = static_cast<std::int64_t>(std::floor(hours));
  time.minutes = static_cast<std::int64_t>(std::llround((hours - std::floor(hours)) * 60.0));
  if (time.minutes == 60) {
    time.hours += 1;
    time.minutes = 0;
  }
  return time;
}

std::string FormatDeliveryTime(const TravelTime& time) {
  return std::to_string(time.hours) + "hrs:" + std::to_string(time.minutes) + "min";
}

std::int64_t ArrivalMinutes(double hours) {
  const auto time  = SplitHours(hours);
  const auto total = time.hours * 60 + time.minutes;
  return std::max(total, kMinimumArrivalMinutes);
}

double AggregateTravelHours(const std::vector<CandidateLeg>& legs, const std::string& selected_rider_id,
                            dispatch::runtime::config::EtaMode mode) {
  double total = 0.0;
  for (const auto& leg : legs) {
    if (mode == dispatch::runtime::config::ETA_MODE_SELECTED_RIDER && leg.rider_id != selected_rider_id) continue;
    total += TravelHours(leg.distance_km, leg.speed_kmh);
  }
  return total;
}

} // namespace dispatch::core
