#pragma once

#include <cstdint>
#include <string>

#include "internal/geo/geo.hpp"

namespace dispatch::db::model {

struct RiderLocationRecord {
  std::string      rider_id;
  geo::Coordinates location;
  uint64_t         updated_at_ms = 0;
};

// Result row of a proximity search.
struct RiderDistance {
  std::string      rider_id;
  geo::Coordinates location;
  double           distance_m = 0.0;
};

} // namespace dispatch::db::model
