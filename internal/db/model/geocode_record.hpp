#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/location.hpp"
#include "internal/model/quality.hpp"

namespace geocache::db::model {

/*
  One immutable version of a ticket's geocode state.

  IMPORTANT:
  - Per ticket_key exactly one row has is_current = true once the ticket
    has been attempted.
  - version is contiguous from 1 and supersedes_record_id points at the
    previous version of the same ticket.
  - Lock fields are the only columns mutated in place.
*/

struct GeocodeRecord {
  uint64_t record_id = 0; // assigned by the repository on insert

  std::string ticket_key;
  std::string record_key; // SHA-256 of the location inputs

  // input snapshot
  std::string street;
  std::string intersection;
  std::string city;
  std::string county;
  std::string ticket_type;
  std::string duration;
  std::string work_type;
  std::string excavator;

  // result
  std::optional<geocache::model::Coordinates> coordinates;
  std::optional<double>                       confidence;
  std::string                                 technique;
  std::string                                 approach;
  std::string                                 rationale;
  std::string                                 error_message;

  // quality
  geocache::model::QualityTier    quality_tier    = geocache::model::QualityTier::kFailed;
  geocache::model::ReviewPriority review_priority = geocache::model::ReviewPriority::kNone;
  std::vector<std::string>        validation_flags;

  // version chain
  uint64_t                version = 0;
  std::optional<uint64_t> supersedes_record_id;
  bool                    is_current       = false;
  uint64_t                created_at_ms    = 0;
  std::string             created_by_stage;

  // reprocessing control
  bool                    locked = false;
  std::string             lock_reason;
  std::optional<uint64_t> locked_at_ms;
  std::string             locked_by;

  std::map<std::string, std::string> metadata;
  std::optional<double>              processing_time_ms;
};

} // namespace geocache::db::model
