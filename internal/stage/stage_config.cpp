#include "stage_config.hpp"

#include <spdlog/fmt/fmt.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace geocache::stage {

std::optional<double> NumberSetting(const StageConfig& config, const std::string& key) {
  const auto it = config.settings.find(key);
  if (it == config.settings.end()) {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    const double value   = std::stod(it->second, &consumed);
    if (consumed != it->second.size()) {
      throw std::invalid_argument(it->second);
    }
    return value;
  } catch (const std::exception&) {
    throw util::ConfigurationError(fmt::format("stage '{}': setting '{}' is not a number: '{}'", config.id, key, it->second));
  }
}

} // namespace geocache::stage
