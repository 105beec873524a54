#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/quality.hpp"

namespace geocache::quality {

/*
  How aggressively a stage revisits records that already have a result.

    kMinor  -> ACCEPTABLE and below
    kMajor  -> GOOD and below
    kAlways -> everything that is not locked
*/
enum class ReprocessThreshold {
  kMinor,
  kMajor,
  kAlways,
};

// Accepts "minor", "major", "always" and the "_enhancement" long forms.
std::optional<ReprocessThreshold> ParseReprocessThreshold(std::string_view value);

std::string_view ToString(ReprocessThreshold threshold);

struct QualityPolicy {
  double excellent_threshold     = 0.90;
  double good_threshold          = 0.80;
  double acceptable_threshold    = 0.65;
  double review_needed_threshold = 0.40;

  double fallback_multiplier = 0.90;
  double penalty_per_flag    = 0.03;
  double max_flag_penalty    = 0.15;

  std::set<std::string> elevated_ticket_types{"Emergency"};
  double                elevated_confidence_threshold = 0.75;
  double                low_confidence_threshold      = 0.50;
};

/*
  Pure tier and review-priority assignment.

  Stateless apart from the policy; safe to share across worker threads.
*/
class QualityAssessor {
 public:
  explicit QualityAssessor(QualityPolicy policy = {});

  const QualityPolicy& Policy() const {
    return policy_;
  }

  model::QualityTier Tier(std::optional<double> confidence, const std::string& technique, const std::string& approach,
                          const std::vector<std::string>& flags, const std::string& ticket_type) const;

  // First matching rule wins; the fallback approach outranks FAILED.
  model::ReviewPriority Priority(std::optional<double> confidence, model::QualityTier tier, const std::vector<std::string>& flags,
                                 const std::string& ticket_type, const std::string& approach) const;

  bool IsElevated(const std::string& ticket_type) const;

  static bool ShouldReprocess(model::QualityTier tier, std::optional<ReprocessThreshold> threshold, bool locked);

  static std::string_view Summary(model::QualityTier tier);

 private:
  QualityPolicy policy_;
};

} // namespace geocache::quality
