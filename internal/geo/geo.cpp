#include "internal/geo/geo.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace dispatch::geo {

namespace {

double ToRadians(double degrees) {
  return degrees * std::numbers::pi / 180.0;
}

} // namespace

double HaversineMeters(const Coordinates& a, const Coordinates& b) {
  const double lat1 = ToRadians(a.latitude);
  const double lat2 = ToRadians(b.latitude);
  const double dlat = lat2 - lat1;
  const double dlon = ToRadians(b.longitude - a.longitude);

  const double h = std::sin(dlat / 2) * std::sin(dlat / 2) + std::cos(lat1) * std::cos(lat2) * std::sin(dlon / 2) * std::sin(dlon / 2);
  return 2 * kEarthRadiusMeters * std::asin(std::min(1.0, std::sqrt(h)));
}

bool IsValid(const Coordinates& c) {
  return std::isfinite(c.latitude) && std::isfinite(c.longitude) && c.latitude >= -90.0 && c.latitude <= 90.0 && c.longitude >= -180.0 &&
         c.longitude <= 180.0;
}

} // namespace dispatch::geo
