#include "stage_factory.hpp"

#include <spdlog/fmt/fmt.h>

#include "internal/util/errors.hpp"

namespace geocache::stage {

void StageFactory::Register(const std::string& technique, Creator creator) {
  if (technique.empty() || !creator) {
    throw util::ConfigurationError("stage creator requires a technique name and a callable");
  }
  creators_[technique] = std::move(creator);
}

bool StageFactory::Has(const std::string& technique) const {
  return creators_.contains(technique);
}

std::vector<std::string> StageFactory::Techniques() const {
  std::vector<std::string> out;
  out.reserve(creators_.size());
  for (const auto& [name, _] : creators_) {
    out.push_back(name);
  }
  return out;
}

std::unique_ptr<Stage> StageFactory::Create(const StageConfig& config) const {
  const auto it = creators_.find(config.technique);
  if (it == creators_.end()) {
    throw util::ConfigurationError(fmt::format("stage '{}': unknown technique '{}'", config.id, config.technique));
  }
  auto stage = it->second(config);
  if (!stage) {
    throw util::ConfigurationError(fmt::format("stage '{}': creator for '{}' returned no stage", config.id, config.technique));
  }
  return stage;
}

} // namespace geocache::stage
