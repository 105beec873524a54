#pragma once

#include <map>
#include <optional>
#include <string>

#include "internal/model/location.hpp"

namespace geocache::model {

/*
  What a stage produced for one ticket.

  Quality tier and review priority are not part of the attempt; the
  pipeline derives them after validation.
*/
struct StageAttempt {
  std::optional<Coordinates> coordinates;
  double                     confidence = 0.0;
  std::string                technique;
  std::string                approach;
  std::string                rationale;

  std::map<std::string, std::string> metadata;
};

} // namespace geocache::model
