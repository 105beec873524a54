#include "geo.hpp"

#include <cmath>
#include <numbers>

namespace geocache::util {

namespace {

double Radians(double degrees) {
  return degrees * std::numbers::pi / 180.0;
}

} // namespace

double HaversineKm(const model::Coordinates& a, const model::Coordinates& b) {
  const double lat1 = Radians(a.latitude);
  const double lat2 = Radians(b.latitude);
  const double dlat = lat2 - lat1;
  const double dlon = Radians(b.longitude - a.longitude);

  const double h = std::sin(dlat / 2) * std::sin(dlat / 2) + std::cos(lat1) * std::cos(lat2) * std::sin(dlon / 2) * std::sin(dlon / 2);
  return 2 * kEarthRadiusKm * std::asin(std::sqrt(h));
}

} // namespace geocache::util
