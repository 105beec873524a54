#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/stage/stage.hpp"

namespace geocache::stage {

/*
  technique name -> stage constructor.

  The composition root registers creators before building stages; an
  unregistered technique is a configuration error.
*/
class StageFactory {
 public:
  using Creator = std::function<std::unique_ptr<Stage>(const StageConfig&)>;

  void Register(const std::string& technique, Creator creator);

  bool Has(const std::string& technique) const;

  std::vector<std::string> Techniques() const;

  std::unique_ptr<Stage> Create(const StageConfig& config) const;

 private:
  std::map<std::string, Creator> creators_;
};

} // namespace geocache::stage
