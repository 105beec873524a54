#pragma once

#include <memory>

#include "internal/stage/stage.hpp"
#include "internal/validation/centroid_registry.hpp"

namespace geocache::stage {

/*
  Last-resort technique: the registered centroid of the ticket's city.

  settings:
    confidence  reported confidence (default 0.35)
*/
class CentroidFallbackStage : public Stage {
 public:
  static constexpr const char* kTechnique          = "centroid_fallback";
  static constexpr const char* kReportedTechnique  = "PROXIMITY_BASED";
  static constexpr double      kDefaultConfidence  = 0.35;

  CentroidFallbackStage(StageConfig config, std::shared_ptr<const validation::CentroidRegistry> centroids);

  const StageConfig& Config() const override {
    return config_;
  }

  model::StageAttempt Process(const model::TicketInput& ticket) override;

 private:
  StageConfig                                         config_;
  std::shared_ptr<const validation::CentroidRegistry> centroids_;
  double                                              confidence_;
};

} // namespace geocache::stage
