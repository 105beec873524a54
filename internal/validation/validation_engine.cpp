#include "validation_engine.hpp"

#include "internal/validation/validation_rules.hpp"

namespace geocache::validation {

ValidationEngine ValidationEngine::WithDefaultRules(const ValidationSettings& settings, std::shared_ptr<const CentroidRegistry> centroids) {
  ValidationEngine engine;
  engine.AddRule(std::make_unique<LowConfidenceRule>(settings.low_confidence_threshold));
  engine.AddRule(std::make_unique<ElevatedTicketRule>(settings.elevated_ticket_types, settings.elevated_confidence_threshold));
  engine.AddRule(std::make_unique<CentroidDistanceRule>(std::move(centroids), settings.max_centroid_distance_km));
  engine.AddRule(std::make_unique<FallbackApproachRule>());
  engine.AddRule(std::make_unique<PartialDataRule>());
  return engine;
}

void ValidationEngine::AddRule(std::unique_ptr<ValidationRule> rule) {
  if (rule) {
    rules_.push_back(std::move(rule));
  }
}

std::vector<ValidationFlag> ValidationEngine::Validate(const ValidationInput& input) const {
  std::vector<ValidationFlag> flags;
  for (const auto& rule : rules_) {
    if (auto flag = rule->Check(input)) {
      flags.push_back(std::move(*flag));
    }
  }
  return flags;
}

std::vector<std::string> ValidationEngine::Codes(const std::vector<ValidationFlag>& flags) {
  std::vector<std::string> codes;
  codes.reserve(flags.size());
  for (const auto& f : flags) {
    codes.push_back(f.code);
  }
  return codes;
}

} // namespace geocache::validation
