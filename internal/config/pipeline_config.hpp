#pragma once

#include <vector>

#include "config/config.pb.h"
#include "internal/pipeline/pipeline.hpp"
#include "internal/quality/quality_assessor.hpp"
#include "internal/stage/stage_config.hpp"
#include "internal/validation/centroid_registry.hpp"
#include "internal/validation/validation_engine.hpp"

namespace geocache::config {

struct PipelineSettings {
  pipeline::PipelineOptions       options;
  std::vector<stage::StageConfig> stages; // enabled stages, in run order
};

/*
  Proto -> validated C++ settings.

  Each builder throws util::ConfigurationError naming the offending
  setting, e.g. "pipeline.stages[1].technique: required".
*/
PipelineSettings BuildPipelineConfig(const geocache::runtime::config::RuntimeConfig& config);

validation::ValidationSettings BuildValidationSettings(const geocache::runtime::config::ValidationConfig& config);

// Built-in table (unless use_builtin_centroids is false) followed by configured entries.
std::vector<validation::CityCentroid> BuildCentroids(const geocache::runtime::config::ValidationConfig& config);

quality::QualityPolicy BuildQualityPolicy(const geocache::runtime::config::ValidationConfig& config);

} // namespace geocache::config
