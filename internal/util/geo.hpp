#pragma once

#include "internal/model/location.hpp"

namespace geocache::util {

inline constexpr double kEarthRadiusKm = 6371.0;

// Great-circle distance in kilometers (haversine).
double HaversineKm(const model::Coordinates& a, const model::Coordinates& b);

} // namespace geocache::util
