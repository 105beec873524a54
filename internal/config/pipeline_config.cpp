#include "pipeline_config.hpp"

#include <google/protobuf/util/json_util.h>
#include <spdlog/fmt/fmt.h>

#include <set>

#include "internal/util/errors.hpp"

namespace geocache::config {

namespace rc = geocache::runtime::config;

namespace {

[[noreturn]] void Invalid(const std::string& setting, const std::string& problem) {
  throw util::ConfigurationError(setting + ": " + problem);
}

double Probability(double value, const std::string& setting) {
  if (value < 0.0 || value > 1.0) {
    Invalid(setting, fmt::format("must be within [0, 1], got {}", value));
  }
  return value;
}

std::string SettingToString(const google::protobuf::Value& value, const std::string& setting) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kNumberValue:
      return fmt::format("{}", value.number_value());
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    case google::protobuf::Value::kNullValue:
      return "";
    default: {
      std::string json;
      auto        status = google::protobuf::util::MessageToJsonString(value, &json);
      if (!status.ok()) {
        Invalid(setting, std::string(status.message()));
      }
      return json;
    }
  }
}

reprocess::SkipRules BuildSkipRules(const rc::SkipRules& proto, const std::string& prefix) {
  reprocess::SkipRules rules;
  if (proto.has_skip_if_locked()) {
    rules.skip_if_locked = proto.skip_if_locked();
  }
  for (int i = 0; i < proto.skip_if_quality_size(); ++i) {
    const auto tier = model::ParseQualityTier(proto.skip_if_quality(i));
    if (!tier) {
      Invalid(fmt::format("{}.skip_if_quality[{}]", prefix, i), fmt::format("unknown quality tier '{}'", proto.skip_if_quality(i)));
    }
    rules.skip_if_quality.insert(*tier);
  }
  if (proto.has_skip_if_confidence()) {
    rules.skip_if_confidence = Probability(proto.skip_if_confidence(), prefix + ".skip_if_confidence");
  }
  rules.skip_if_technique.insert(proto.skip_if_technique().begin(), proto.skip_if_technique().end());
  rules.skip_if_approach.insert(proto.skip_if_approach().begin(), proto.skip_if_approach().end());
  return rules;
}

} // namespace

PipelineSettings BuildPipelineConfig(const rc::RuntimeConfig& config) {
  const auto& proto = config.pipeline();

  PipelineSettings settings;
  settings.options.name      = proto.name().empty() ? "geocache" : proto.name();
  settings.options.fail_fast = proto.fail_fast();
  settings.options.workers   = proto.workers() == 0 ? 1 : proto.workers();

  auto status = google::protobuf::util::MessageToJsonString(proto, &settings.options.config_json);
  if (!status.ok()) {
    Invalid("pipeline", std::string(status.message()));
  }

  std::set<std::string> ids;
  for (int i = 0; i < proto.stages_size(); ++i) {
    const auto&       stage  = proto.stages(i);
    const std::string prefix = fmt::format("pipeline.stages[{}]", i);

    stage::StageConfig sc;
    sc.id        = stage.id();
    sc.technique = stage.technique();
    sc.enabled   = !stage.has_enabled() || stage.enabled();
    if (sc.id.empty()) Invalid(prefix + ".id", "required");
    if (sc.technique.empty()) Invalid(prefix + ".technique", "required");
    if (!ids.insert(sc.id).second) Invalid(prefix + ".id", fmt::format("duplicate stage id '{}'", sc.id));

    sc.skip_rules = BuildSkipRules(stage.skip_rules(), prefix + ".skip_rules");

    if (!stage.reprocess_threshold().empty()) {
      sc.reprocess_threshold = quality::ParseReprocessThreshold(stage.reprocess_threshold());
      if (!sc.reprocess_threshold) {
        Invalid(prefix + ".reprocess_threshold", fmt::format("unknown value '{}'", stage.reprocess_threshold()));
      }
    }

    for (const auto& [key, value] : stage.settings().fields()) {
      sc.settings[key] = SettingToString(value, prefix + ".settings." + key);
    }

    if (sc.enabled) {
      settings.stages.push_back(std::move(sc));
    }
  }

  if (settings.stages.empty()) {
    Invalid("pipeline.stages", "at least one enabled stage is required");
  }
  return settings;
}

validation::ValidationSettings BuildValidationSettings(const rc::ValidationConfig& config) {
  validation::ValidationSettings settings;
  if (config.has_low_confidence_threshold()) {
    settings.low_confidence_threshold = Probability(config.low_confidence_threshold(), "validation.low_confidence_threshold");
  }
  if (config.has_elevated_confidence_threshold()) {
    settings.elevated_confidence_threshold =
        Probability(config.elevated_confidence_threshold(), "validation.elevated_confidence_threshold");
  }
  if (config.elevated_ticket_types_size() > 0) {
    settings.elevated_ticket_types = {config.elevated_ticket_types().begin(), config.elevated_ticket_types().end()};
  }
  if (config.has_max_centroid_distance_km()) {
    if (config.max_centroid_distance_km() <= 0.0) {
      Invalid("validation.max_centroid_distance_km", "must be positive");
    }
    settings.max_centroid_distance_km = config.max_centroid_distance_km();
  }
  return settings;
}

std::vector<validation::CityCentroid> BuildCentroids(const rc::ValidationConfig& config) {
  std::vector<validation::CityCentroid> centroids;
  if (!config.has_use_builtin_centroids() || config.use_builtin_centroids()) {
    centroids = validation::CentroidRegistry::Builtin();
  }
  for (int i = 0; i < config.centroids_size(); ++i) {
    const auto&       c      = config.centroids(i);
    const std::string prefix = fmt::format("validation.centroids[{}]", i);
    if (c.city().empty()) Invalid(prefix + ".city", "required");
    if (c.county().empty()) Invalid(prefix + ".county", "required");

    const model::Coordinates location{c.latitude(), c.longitude()};
    if (!model::IsValid(location)) {
      Invalid(prefix, fmt::format("coordinates ({}, {}) out of range", c.latitude(), c.longitude()));
    }
    centroids.push_back({c.city(), c.county(), location});
  }
  return centroids;
}

quality::QualityPolicy BuildQualityPolicy(const rc::ValidationConfig& config) {
  const auto validation = BuildValidationSettings(config);

  quality::QualityPolicy policy;
  policy.elevated_ticket_types         = validation.elevated_ticket_types;
  policy.elevated_confidence_threshold = validation.elevated_confidence_threshold;
  return policy;
}

} // namespace geocache::config
