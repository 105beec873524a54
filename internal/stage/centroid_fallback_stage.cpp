#include "centroid_fallback_stage.hpp"

#include <spdlog/fmt/fmt.h>

#include "internal/util/errors.hpp"

namespace geocache::stage {

CentroidFallbackStage::CentroidFallbackStage(StageConfig config, std::shared_ptr<const validation::CentroidRegistry> centroids)
    : config_(std::move(config)), centroids_(std::move(centroids)) {
  if (!centroids_ || centroids_->Empty()) {
    throw util::ConfigurationError(fmt::format("stage '{}': centroid_fallback requires validation.centroids", config_.id));
  }
  confidence_ = NumberSetting(config_, "confidence").value_or(kDefaultConfidence);
  if (confidence_ <= 0.0 || confidence_ > 1.0) {
    throw util::ConfigurationError(fmt::format("stage '{}': settings.confidence must be in (0, 1]", config_.id));
  }
}

model::StageAttempt CentroidFallbackStage::Process(const model::TicketInput& ticket) {
  const auto centroid = centroids_->Find(ticket.city, ticket.county);
  if (!centroid) {
    throw util::StageFailure(fmt::format("no centroid registered for {}, {}", ticket.city, ticket.county));
  }

  model::StageAttempt attempt;
  attempt.coordinates = *centroid;
  attempt.confidence  = confidence_;
  attempt.technique   = kReportedTechnique;
  attempt.approach    = model::kFallbackApproach;
  attempt.rationale   = fmt::format("Roads '{}' and '{}' not resolved; using {} city centroid", ticket.street, ticket.intersection,
                                    ticket.city);
  attempt.metadata["centroid_city"]   = ticket.city;
  attempt.metadata["centroid_county"] = ticket.county;
  return attempt;
}

} // namespace geocache::stage
