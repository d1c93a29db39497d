#pragma once

#include <algorithm>
#include <vector>

#include "internal/db/model/rider_location_record.hpp"
#include "internal/geo/geo.hpp"

namespace dispatch::db {

// Metres per degree of latitude, used for the SQL bounding-box prefilter.
constexpr double kMetersPerDegreeLatitude = 111320.0;

// Keeps locations within max_distance_m of origin, nearest first, ties by rider id.
inline std::vector<model::RiderDistance> RankByDistance(const geo::Coordinates& origin, double max_distance_m,
                                                        const std::vector<model::RiderLocationRecord>& locations) {
  std::vector<model::RiderDistance> ranked;
  for (const auto& location : locations) {
    const double distance = geo::HaversineMeters(origin, location.location);
    if (distance <= max_distance_m) {
      ranked.push_back({location.rider_id, location.location, distance});
    }
  }

  std::sort(ranked.begin(), ranked.end(), [](const model::RiderDistance& a, const model::RiderDistance& b) {
    if (a.distance_m != b.distance_m) return a.distance_m < b.distance_m;
    return a.rider_id < b.rider_id;
  });
  return ranked;
}

} // namespace dispatch::db
