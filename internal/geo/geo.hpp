#pragma once

namespace dispatch::geo {

struct Coordinates {
  double latitude  = 0.0;
  double longitude = 0.0;
};

constexpr double kEarthRadiusMeters = 6371008.8;

// Great-circle distance on a spherical earth.
double HaversineMeters(const Coordinates& a, const Coordinates& b);

inline double MetersToKm(double meters) {
  return meters / 1000.0;
}

bool IsValid(const Coordinates& c);

} // namespace dispatch::geo
