#include "quality_assessor.hpp"

#include <algorithm>

#include "internal/model/location.hpp"

namespace geocache::quality {

using model::QualityTier;
using model::ReviewPriority;

std::optional<ReprocessThreshold> ParseReprocessThreshold(std::string_view value) {
  if (value == "always") return ReprocessThreshold::kAlways;
  if (value == "minor" || value == "minor_enhancement") return ReprocessThreshold::kMinor;
  if (value == "major" || value == "major_enhancement") return ReprocessThreshold::kMajor;
  return std::nullopt;
}

std::string_view ToString(ReprocessThreshold threshold) {
  switch (threshold) {
    case ReprocessThreshold::kAlways:
      return "always";
    case ReprocessThreshold::kMajor:
      return "major";
    case ReprocessThreshold::kMinor:
    default:
      return "minor";
  }
}

QualityAssessor::QualityAssessor(QualityPolicy policy) : policy_(std::move(policy)) {
}

QualityTier QualityAssessor::Tier(std::optional<double> confidence, const std::string& /*technique*/, const std::string& approach,
                                  const std::vector<std::string>& flags, const std::string& /*ticket_type*/) const {
  if (!confidence || *confidence == 0.0) {
    return QualityTier::kFailed;
  }

  double adjusted = *confidence;
  if (approach == model::kFallbackApproach) {
    adjusted *= policy_.fallback_multiplier;
  }
  if (!flags.empty()) {
    const double penalty = std::min(policy_.penalty_per_flag * static_cast<double>(flags.size()), policy_.max_flag_penalty);
    adjusted *= 1.0 - penalty;
  }

  if (adjusted >= policy_.excellent_threshold) return QualityTier::kExcellent;
  if (adjusted >= policy_.good_threshold) return QualityTier::kGood;
  if (adjusted >= policy_.acceptable_threshold) return QualityTier::kAcceptable;
  if (adjusted >= policy_.review_needed_threshold) return QualityTier::kReviewNeeded;
  return QualityTier::kFailed;
}

ReviewPriority QualityAssessor::Priority(std::optional<double> confidence, QualityTier tier, const std::vector<std::string>& flags,
                                         const std::string& ticket_type, const std::string& approach) const {
  if (approach == model::kFallbackApproach) {
    return ReviewPriority::kHigh;
  }
  if (tier == QualityTier::kFailed) {
    return ReviewPriority::kCritical;
  }

  // a zero confidence counts as "no confidence" for the two checks below
  const bool has_confidence = confidence && *confidence != 0.0;
  if (has_confidence && IsElevated(ticket_type) && *confidence < policy_.elevated_confidence_threshold) {
    return ReviewPriority::kHigh;
  }
  if (has_confidence && *confidence < policy_.low_confidence_threshold) {
    return ReviewPriority::kHigh;
  }

  if (tier == QualityTier::kReviewNeeded) {
    return ReviewPriority::kMedium;
  }
  if (flags.size() >= 2) {
    return ReviewPriority::kMedium;
  }
  if (tier == QualityTier::kAcceptable && !flags.empty()) {
    return ReviewPriority::kLow;
  }
  return ReviewPriority::kNone;
}

bool QualityAssessor::IsElevated(const std::string& ticket_type) const {
  return policy_.elevated_ticket_types.contains(ticket_type);
}

bool QualityAssessor::ShouldReprocess(QualityTier tier, std::optional<ReprocessThreshold> threshold, bool locked) {
  if (locked) {
    return false;
  }
  if (!threshold) {
    return false;
  }
  switch (*threshold) {
    case ReprocessThreshold::kAlways:
      return true;
    case ReprocessThreshold::kMinor:
      return tier <= QualityTier::kAcceptable;
    case ReprocessThreshold::kMajor:
      return tier <= QualityTier::kGood;
  }
  return false;
}

std::string_view QualityAssessor::Summary(QualityTier tier) {
  switch (tier) {
    case QualityTier::kExcellent:
      return "High confidence, no review needed";
    case QualityTier::kGood:
      return "Reliable, reprocess only with major improvements";
    case QualityTier::kAcceptable:
      return "Usable, reprocess with any improvement";
    case QualityTier::kReviewNeeded:
      return "Low confidence, human review recommended";
    case QualityTier::kFailed:
    default:
      return "Geocoding failed, manual intervention required";
  }
}

} // namespace geocache::quality
