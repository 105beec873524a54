#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/location.hpp"
#include "internal/model/quality.hpp"

namespace geocache::validation {

struct ValidationFlag {
  std::string          code;
  model::Severity      severity = model::Severity::kInfo;
  std::string          message;
  std::string          suggested_action;
};

/*
  Everything a rule may look at: the stage attempt plus the ticket fields
  it was produced from.
*/
struct ValidationInput {
  std::optional<model::Coordinates> coordinates;
  std::optional<double>             confidence;
  std::string                       technique;
  std::string                       approach;

  std::string street;
  std::string intersection;
  std::string city;
  std::string county;
  std::string ticket_type;
};

class ValidationRule {
 public:
  virtual ~ValidationRule() = default;

  // Stable identifier of the flag this rule emits.
  virtual std::string_view Code() const = 0;

  // Returns a flag if the rule triggers for this input.
  virtual std::optional<ValidationFlag> Check(const ValidationInput& input) const = 0;
};

} // namespace geocache::validation
