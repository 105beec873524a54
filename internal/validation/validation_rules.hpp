#pragma once

#include <memory>
#include <set>
#include <string>

#include "internal/validation/centroid_registry.hpp"
#include "internal/validation/validation_rule.hpp"

namespace geocache::validation {

class LowConfidenceRule : public ValidationRule {
 public:
  explicit LowConfidenceRule(double threshold = 0.65);

  std::string_view              Code() const override;
  std::optional<ValidationFlag> Check(const ValidationInput& input) const override;

 private:
  double threshold_;
};

// Tickets whose type is in the elevated set need a higher bar.
class ElevatedTicketRule : public ValidationRule {
 public:
  ElevatedTicketRule(std::set<std::string> ticket_types = {"Emergency"}, double threshold = 0.75);

  std::string_view              Code() const override;
  std::optional<ValidationFlag> Check(const ValidationInput& input) const override;

 private:
  std::set<std::string> ticket_types_;
  double                threshold_;
};

class CentroidDistanceRule : public ValidationRule {
 public:
  CentroidDistanceRule(std::shared_ptr<const CentroidRegistry> centroids, double max_km = 50.0);

  std::string_view              Code() const override;
  std::optional<ValidationFlag> Check(const ValidationInput& input) const override;

 private:
  std::shared_ptr<const CentroidRegistry> centroids_;
  double                                  max_km_;
};

class FallbackApproachRule : public ValidationRule {
 public:
  std::string_view              Code() const override;
  std::optional<ValidationFlag> Check(const ValidationInput& input) const override;
};

class PartialDataRule : public ValidationRule {
 public:
  std::string_view              Code() const override;
  std::optional<ValidationFlag> Check(const ValidationInput& input) const override;
};

} // namespace geocache::validation
