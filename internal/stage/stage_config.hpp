#pragma once

#include <map>
#include <optional>
#include <string>

#include "internal/quality/quality_assessor.hpp"
#include "internal/reprocess/reprocessing_decider.hpp"

namespace geocache::stage {

/*
  Validated, immutable per-stage configuration.

  Built once by BuildPipelineConfig; technique-specific knobs stay in
  `settings` as strings and are interpreted by the stage itself.
*/
struct StageConfig {
  std::string                                  id;
  std::string                                  technique;
  bool                                         enabled = true;
  reprocess::SkipRules                         skip_rules;
  std::optional<quality::ReprocessThreshold>   reprocess_threshold;
  std::map<std::string, std::string>           settings;
};

// Parses settings[key] as a double. Throws util::ConfigurationError if malformed.
std::optional<double> NumberSetting(const StageConfig& config, const std::string& key);

} // namespace geocache::stage
