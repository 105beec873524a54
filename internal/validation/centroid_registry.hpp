#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/location.hpp"

namespace geocache::validation {

struct CityCentroid {
  std::string        city;
  std::string        county;
  model::Coordinates location;
};

/*
  (city, county) -> centroid lookup.

  Keys are upper-cased on insert and lookup. Read-only after construction,
  shared by the distance rule and the centroid fallback stage.
*/
class CentroidRegistry {
 public:
  CentroidRegistry() = default;
  explicit CentroidRegistry(const std::vector<CityCentroid>& centroids);

  // West Texas cities the distance rule ships with.
  static std::vector<CityCentroid> Builtin();

  // Later entries for the same city/county replace earlier ones.
  void Add(const CityCentroid& centroid);

  std::optional<model::Coordinates> Find(const std::string& city, const std::string& county) const;

  std::size_t Size() const {
    return entries_.size();
  }

  bool Empty() const {
    return entries_.empty();
  }

 private:
  std::map<std::pair<std::string, std::string>, model::Coordinates> entries_;
};

} // namespace geocache::validation
