#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace dispatch::core {

inline constexpr std::int64_t kMinimumArrivalMinutes = 2;

struct TravelTime {
  std::int64_t hours   = 0;
  std::int64_t minutes = 0;
};

// Throws util::InvalidArgument for a non-positive speed or negative distance.
double TravelHours(double distance_km, double speed_kmh);

// Whole hours plus the rounded remainder in minutes (60 carries into hours).
TravelTime SplitHours(double hours);

// "<hours>hrs:<minutes>min"
std::string FormatDeliveryTime(const TravelTime& time);

// Total minutes, never below kMinimumArrivalMinutes.
std::int64_t ArrivalMinutes(double hours);

// One rider returned by the proximity search.
struct CandidateLeg {
  std::string rider_id;
  double      distance_km = 0.0;
  double      speed_kmh   = 0.0;
};

/*
  Travel hours used for the arrival estimate.

  ETA_MODE_ALL_CANDIDATES (and unspecified) sums every candidate's leg;
  ETA_MODE_SELECTED_RIDER uses only the leg of selected_rider_id.
*/
double AggregateTravelHours(const std::vector<CandidateLeg>& legs, const std::string& selected_rider_id,
                            dispatch::runtime::config::EtaMode mode);

} // namespace dispatch::core
