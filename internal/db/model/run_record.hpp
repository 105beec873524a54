#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace geocache::db::model {

/*
  One pipeline invocation.

  Inserted with status "running" and finished with "completed" or
  "aborted"; results_json carries the aggregated statistics.
*/

struct RunRecord {
  std::string run_id;
  std::string pipeline_name;
  std::string status;

  uint64_t                started_at_ms  = 0;
  std::optional<uint64_t> finished_at_ms;

  uint64_t    ticket_count = 0;
  std::string config_json;
  std::string results_json;
};

} // namespace geocache::db::model
