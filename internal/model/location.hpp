#pragma once

namespace geocache::model {

struct Coordinates {
  double latitude  = 0.0;
  double longitude = 0.0;
};

constexpr bool IsValid(const Coordinates& c) {
  return c.latitude >= -90.0 && c.latitude <= 90.0 && c.longitude >= -180.0 && c.longitude <= 180.0;
}

// Approach emitted by the city-centroid fallback technique.
inline constexpr const char* kFallbackApproach = "city_centroid_fallback";

// Approach emitted when only one road of an intersection could be resolved.
inline constexpr const char* kPartialDataApproach = "city_primary";

} // namespace geocache::model
