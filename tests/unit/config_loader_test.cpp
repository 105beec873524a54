#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/config/pipeline_config.hpp"
#include "internal/util/errors.hpp"

namespace {

using geocache::config::ConfigLoader;
using geocache::util::ConfigurationError;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "geocache_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

// Returns the ConfigurationError message, or "" if nothing was thrown.
template <typename Fn>
std::string ConfigErrorOf(Fn&& fn) {
  try {
    fn();
  } catch (const ConfigurationError& ex) {
    return ex.what();
  }
  return "";
}

void TestFullDocumentLoads() {
  const auto yaml_path = WriteYaml("full", R"(logging:
  level: debug
database:
  sqlite:
    path: "C:\\geocache\\\"quoted\"\\cache.db"
validation:
  low_confidence_threshold: 0.6
  elevated_ticket_types: ["Emergency", "Damage"]
  centroids:
    - city: Seminole
      county: Gaines
      latitude: 32.719
      longitude: -102.6449
pipeline:
  name: nightly
  fail_fast: true
  workers: 4
  stages:
    - id: fallback
      technique: centroid_fallback
      reprocess_threshold: major_enhancement
      skip_rules:
        skip_if_locked: false
        skip_if_quality: [EXCELLENT, GOOD]
        skip_if_confidence: 0.8
        skip_if_approach: [city_centroid_fallback]
      settings:
        confidence: 0.4
        label: "007"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().sqlite().path() == "C:\\geocache\\\"quoted\"\\cache.db");
  assert(!config.database().sqlite().has_wal_mode());
  assert(config.validation().centroids_size() == 1);

  const auto settings = geocache::config::BuildPipelineConfig(config);
  assert(settings.options.name == "nightly");
  assert(settings.options.fail_fast);
  assert(settings.options.workers == 4);
  assert(settings.options.config_json.find("nightly") != std::string::npos);
  assert(settings.stages.size() == 1);

  const auto& stage = settings.stages[0];
  assert(stage.technique == "centroid_fallback");
  assert(!stage.skip_rules.skip_if_locked);
  assert(stage.skip_rules.skip_if_quality.size() == 2);
  assert(stage.skip_rules.skip_if_confidence == 0.8);
  assert(stage.skip_rules.skip_if_approach.contains("city_centroid_fallback"));
  assert(stage.reprocess_threshold == geocache::quality::ReprocessThreshold::kMajor);
  assert(geocache::stage::NumberSetting(stage, "confidence") == 0.4);
  // quoted scalars stay strings
  assert(stage.settings.at("label") == "007");

  const auto validation = geocache::config::BuildValidationSettings(config.validation());
  assert(validation.low_confidence_threshold == 0.6);
  assert(validation.elevated_ticket_types.contains("Damage"));
  assert(geocache::config::BuildCentroids(config.validation()).size() == 10);
  assert(geocache::config::BuildQualityPolicy(config.validation()).elevated_ticket_types.size() == 2);
}

void TestEnvironmentExpansion() {
  ::setenv("GEOCACHE_TEST_DB", "/var/lib/geocache/test.db", 1);
  ::unsetenv("GEOCACHE_TEST_UNSET");

  assert(ConfigLoader::ExpandEnvironment("${GEOCACHE_TEST_DB}") == "/var/lib/geocache/test.db");
  assert(ConfigLoader::ExpandEnvironment("${GEOCACHE_TEST_UNSET:fallback.db}") == "fallback.db");
  assert(ConfigLoader::ExpandEnvironment("prefix-${GEOCACHE_TEST_UNSET:}-suffix") == "prefix--suffix");
  assert(ConfigLoader::ExpandEnvironment("no variables") == "no variables");

  assert(!ConfigErrorOf([] { (void)ConfigLoader::ExpandEnvironment("${GEOCACHE_TEST_UNSET}"); }).empty());
  assert(!ConfigErrorOf([] { (void)ConfigLoader::ExpandEnvironment("${GEOCACHE_TEST_DB"); }).empty());

  const auto config = ConfigLoader::LoadFromString(R"(database:
  sqlite:
    path: ${GEOCACHE_TEST_DB}
pipeline:
  workers: ${GEOCACHE_TEST_UNSET:3}
  stages:
    - id: fallback
      technique: centroid_fallback
)");
  assert(config.database().sqlite().path() == "/var/lib/geocache/test.db");
  assert(config.pipeline().workers() == 3);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(database:
  sqlite:
    path: "/tmp/geocache.db"
    unexpected_field: true
)");

  const auto message = ConfigErrorOf([&] { (void)ConfigLoader::LoadFromYaml(yaml_path.string()); });
  assert(!message.empty() && "ConfigLoader must reject unknown fields.");
}

void TestMalformedDocuments() {
  assert(!ConfigErrorOf([] { (void)ConfigLoader::LoadFromYaml("/nonexistent/geocache.yaml"); }).empty());
  assert(!ConfigErrorOf([] { (void)ConfigLoader::LoadFromString("- just\n- a list\n"); }).empty());

  // an empty document is the default configuration
  const auto config = ConfigLoader::LoadFromString("");
  assert(!config.has_database());
}

void TestPipelineConfigErrorsNameTheSetting() {
  auto load = [](const std::string& stages) {
    return ConfigLoader::LoadFromString("pipeline:\n  stages:\n" + stages);
  };
  auto build_error = [](const geocache::runtime::config::RuntimeConfig& config) {
    return ConfigErrorOf([&] { (void)geocache::config::BuildPipelineConfig(config); });
  };

  assert(build_error(load("    - technique: centroid_fallback\n")) == "pipeline.stages[0].id: required");
  assert(build_error(load("    - id: a\n")) == "pipeline.stages[0].technique: required");
  assert(build_error(load("    - id: a\n      technique: x\n    - id: a\n      technique: y\n")) ==
         "pipeline.stages[1].id: duplicate stage id 'a'");
  assert(build_error(load("    - id: a\n      technique: x\n      skip_rules:\n        skip_if_quality: [PERFECT]\n")) ==
         "pipeline.stages[0].skip_rules.skip_if_quality[0]: unknown quality tier 'PERFECT'");
  assert(!build_error(load("    - id: a\n      technique: x\n      skip_rules:\n        skip_if_confidence: 1.5\n")).empty());
  assert(!build_error(load("    - id: a\n      technique: x\n      reprocess_threshold: sometimes\n")).empty());
  assert(build_error(load("    - id: a\n      technique: x\n      enabled: false\n")) ==
         "pipeline.stages: at least one enabled stage is required");

  geocache::runtime::config::ValidationConfig validation;
  auto* centroid = validation.add_centroids();
  centroid->set_city("Nowhere");
  centroid->set_county("Ward");
  centroid->set_latitude(95.0);
  assert(!ConfigErrorOf([&] { (void)geocache::config::BuildCentroids(validation); }).empty());

  validation.Clear();
  validation.set_use_builtin_centroids(false);
  assert(geocache::config::BuildCentroids(validation).empty());
}

void TestExampleConfigLoads() {
  ::unsetenv("GEOCACHE_DB_PATH");
  const auto config = ConfigLoader::LoadFromYaml(std::string(GEOCACHE_SOURCE_DIR) + "/config/geocache.example.yaml");
  assert(config.database().sqlite().path() == "geocache.db");

  const auto settings = geocache::config::BuildPipelineConfig(config);
  assert(settings.stages.size() == 1);
  assert(settings.stages[0].reprocess_threshold == geocache::quality::ReprocessThreshold::kMinor);
}

} // namespace

int main() {
  TestFullDocumentLoads();
  TestEnvironmentExpansion();
  TestUnknownFieldsAreRejected();
  TestMalformedDocuments();
  TestPipelineConfigErrorsNameTheSetting();
  TestExampleConfigLoads();

  std::cout << "geocache_unit_config_loader: pass\n";
  return 0;
}
