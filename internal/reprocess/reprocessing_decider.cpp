#include "reprocessing_decider.hpp"

#include <spdlog/fmt/fmt.h>

namespace geocache::reprocess {

using model::QualityTier;

SkipDecision ReprocessingDecider::ShouldSkip(const std::optional<db::model::GeocodeRecord>& current, const std::string& stage_id,
                                             const SkipRules& rules) {
  if (!current) {
    return {false, SkipBranch::kNoCurrentRecord, "No cached record"};
  }
  const auto& r = *current;

  if (rules.skip_if_locked && r.locked) {
    return {true, SkipBranch::kLocked, fmt::format("Locked ({})", r.lock_reason)};
  }

  if (rules.skip_if_quality.contains(r.quality_tier)) {
    return {true, SkipBranch::kQualityTier, fmt::format("Quality tier {} in skip list", model::ToString(r.quality_tier))};
  }

  if (rules.skip_if_confidence && r.confidence && *r.confidence >= *rules.skip_if_confidence) {
    return {true, SkipBranch::kConfidence,
            fmt::format("Confidence {:.2f}% >= {:.2f}%", *r.confidence * 100.0, *rules.skip_if_confidence * 100.0)};
  }

  if (rules.skip_if_technique.contains(r.technique)) {
    return {true, SkipBranch::kTechnique, fmt::format("Technique {} in skip list", r.technique)};
  }

  if (rules.skip_if_approach.contains(r.approach)) {
    return {true, SkipBranch::kApproach, fmt::format("Approach {} in skip list", r.approach)};
  }

  // a stage never reprocesses its own output
  if (r.created_by_stage == stage_id) {
    return {true, SkipBranch::kSameStage, fmt::format("Already processed by {}", stage_id)};
  }

  return {false, SkipBranch::kNoRuleMatched, "No skip rules matched"};
}

ReprocessDecision ReprocessingDecider::ShouldReprocessByQuality(QualityTier tier, std::optional<quality::ReprocessThreshold> threshold,
                                                                bool locked) {
  if (locked) {
    return {false, "Geocode is locked"};
  }
  if (!threshold) {
    return {false, "No reprocess threshold (EXCELLENT only)"};
  }

  const bool reprocess = quality::QualityAssessor::ShouldReprocess(tier, threshold, locked);
  switch (*threshold) {
    case quality::ReprocessThreshold::kAlways:
      return {true, "Threshold is 'always'"};
    case quality::ReprocessThreshold::kMinor:
      return {reprocess, fmt::format("Quality {} {} ACCEPTABLE", model::ToString(tier), reprocess ? "<=" : ">")};
    case quality::ReprocessThreshold::kMajor:
      return {reprocess, fmt::format("Quality {} {} GOOD", model::ToString(tier), reprocess ? "<=" : ">")};
  }
  return {false, "Unknown reprocess threshold"};
}

std::string ReprocessingDecider::Explain(const SkipDecision& decision) {
  return fmt::format("{}: {}", decision.skip ? "SKIP" : "REPROCESS", decision.reason);
}

} // namespace geocache::reprocess
