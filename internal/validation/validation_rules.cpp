#include "validation_rules.hpp"

#include <spdlog/fmt/fmt.h>

#include "internal/util/geo.hpp"

namespace geocache::validation {

using model::Severity;

// ------------------------------------------------------------------
// low_confidence
// ------------------------------------------------------------------

LowConfidenceRule::LowConfidenceRule(double threshold) : threshold_(threshold) {
}

std::string_view LowConfidenceRule::Code() const {
  return "low_confidence";
}

std::optional<ValidationFlag> LowConfidenceRule::Check(const ValidationInput& input) const {
  if (!input.confidence || *input.confidence >= threshold_) {
    return std::nullopt;
  }
  return ValidationFlag{std::string(Code()), Severity::kWarning,
                        fmt::format("Confidence {:.1f}% is below threshold {:.1f}%", *input.confidence * 100.0, threshold_ * 100.0),
                        "Review location accuracy; consider alternative geocoding methods"};
}

// ------------------------------------------------------------------
// emergency_low_confidence
// ------------------------------------------------------------------

ElevatedTicketRule::ElevatedTicketRule(std::set<std::string> ticket_types, double threshold)
    : ticket_types_(std::move(ticket_types)), threshold_(threshold) {
}

std::string_view ElevatedTicketRule::Code() const {
  return "emergency_low_confidence";
}

std::optional<ValidationFlag> ElevatedTicketRule::Check(const ValidationInput& input) const {
  if (!input.confidence || *input.confidence >= threshold_) {
    return std::nullopt;
  }
  if (!ticket_types_.contains(input.ticket_type)) {
    return std::nullopt;
  }
  return ValidationFlag{std::string(Code()), Severity::kError,
                        fmt::format("{} ticket has {:.1f}% confidence (below {:.1f}%)", input.ticket_type, *input.confidence * 100.0,
                                    threshold_ * 100.0),
                        "High priority review - emergency response location must be accurate"};
}

// ------------------------------------------------------------------
// distance_from_city
// ------------------------------------------------------------------

CentroidDistanceRule::CentroidDistanceRule(std::shared_ptr<const CentroidRegistry> centroids, double max_km)
    : centroids_(std::move(centroids)), max_km_(max_km) {
}

std::string_view CentroidDistanceRule::Code() const {
  return "distance_from_city";
}

std::optional<ValidationFlag> CentroidDistanceRule::Check(const ValidationInput& input) const {
  if (!input.coordinates || !centroids_) {
    return std::nullopt;
  }
  const auto centroid = centroids_->Find(input.city, input.county);
  if (!centroid) {
    return std::nullopt;
  }

  const double distance = util::HaversineKm(*input.coordinates, *centroid);
  if (distance <= max_km_) {
    return std::nullopt;
  }
  return ValidationFlag{std::string(Code()), Severity::kWarning,
                        fmt::format("Location {:.1f}km from {} center (max: {}km)", distance, input.city, max_km_),
                        "Verify location is correct for this city"};
}

// ------------------------------------------------------------------
// fallback_used / one_road_missing
// ------------------------------------------------------------------

std::string_view FallbackApproachRule::Code() const {
  return "fallback_used";
}

std::optional<ValidationFlag> FallbackApproachRule::Check(const ValidationInput& input) const {
  if (input.approach != model::kFallbackApproach) {
    return std::nullopt;
  }
  return ValidationFlag{std::string(Code()), Severity::kError, "Both roads missing from network; used city centroid approximation",
                        "Locate actual work area - city centroid is very approximate"};
}

std::string_view PartialDataRule::Code() const {
  return "one_road_missing";
}

std::optional<ValidationFlag> PartialDataRule::Check(const ValidationInput& input) const {
  if (input.approach != model::kPartialDataApproach) {
    return std::nullopt;
  }
  return ValidationFlag{std::string(Code()), Severity::kWarning, "One road not found in network; used city + available road",
                        "Consider finding missing road for more precise location"};
}

} // namespace geocache::validation
