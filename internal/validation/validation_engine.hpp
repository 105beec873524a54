#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/validation/centroid_registry.hpp"
#include "internal/validation/validation_rule.hpp"

namespace geocache::validation {

struct ValidationSettings {
  double                low_confidence_threshold      = 0.65;
  double                elevated_confidence_threshold = 0.75;
  std::set<std::string> elevated_ticket_types{"Emergency"};
  double                max_centroid_distance_km = 50.0;
};

/*
  Ordered rule list.

  Validate runs every rule and returns the triggered flags in rule order.
  Rules are added during assembly; the engine is read-only afterwards and
  may be shared across worker threads.
*/
class ValidationEngine {
 public:
  ValidationEngine() = default;

  // Engine with the five built-in rules in their canonical order.
  static ValidationEngine WithDefaultRules(const ValidationSettings& settings, std::shared_ptr<const CentroidRegistry> centroids);

  void AddRule(std::unique_ptr<ValidationRule> rule);

  std::vector<ValidationFlag> Validate(const ValidationInput& input) const;

  std::size_t RuleCount() const {
    return rules_.size();
  }

  static std::vector<std::string> Codes(const std::vector<ValidationFlag>& flags);

 private:
  std::vector<std::unique_ptr<ValidationRule>> rules_;
};

} // namespace geocache::validation
