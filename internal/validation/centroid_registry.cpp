#include "centroid_registry.hpp"

#include "internal/util/hash.hpp"

namespace geocache::validation {

CentroidRegistry::CentroidRegistry(const std::vector<CityCentroid>& centroids) {
  for (const auto& c : centroids) {
    Add(c);
  }
}

std::vector<CityCentroid> CentroidRegistry::Builtin() {
  return {
      {"KERMIT", "WINKLER", {31.8576, -103.0930}},   {"PYOTE", "WARD", {31.5401, -103.1293}},
      {"BARSTOW", "WARD", {31.4596, -103.3954}},     {"MONAHANS", "WARD", {31.5943, -102.8929}},
      {"ANDREWS", "ANDREWS", {32.3185, -102.5457}},  {"GARDENDALE", "ANDREWS", {32.0165, -102.3779}},
      {"COYANOSA", "WARD", {31.2693, -103.0324}},    {"WICKETT", "WARD", {31.5768, -103.0010}},
      {"THORNTONVILLE", "WARD", {31.4446, -103.1079}},
  };
}

void CentroidRegistry::Add(const CityCentroid& centroid) {
  entries_[{util::ToUpper(centroid.city), util::ToUpper(centroid.county)}] = centroid.location;
}

std::optional<model::Coordinates> CentroidRegistry::Find(const std::string& city, const std::string& county) const {
  if (city.empty() || county.empty()) {
    return std::nullopt;
  }
  const auto it = entries_.find({util::ToUpper(city), util::ToUpper(county)});
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace geocache::validation
