#pragma once

#include <optional>
#include <set>
#include <string>

#include "internal/db/model/geocode_record.hpp"
#include "internal/model/quality.hpp"
#include "internal/quality/quality_assessor.hpp"

namespace geocache::reprocess {

struct SkipRules {
  bool                          skip_if_locked = true;
  std::set<model::QualityTier>  skip_if_quality;
  std::optional<double>         skip_if_confidence;
  std::set<std::string>         skip_if_technique;
  std::set<std::string>         skip_if_approach;
};

// Which rule decided. Order matches evaluation order.
enum class SkipBranch {
  kNoCurrentRecord,
  kLocked,
  kQualityTier,
  kConfidence,
  kTechnique,
  kApproach,
  kSameStage,
  kNoRuleMatched,
};

struct SkipDecision {
  bool        skip = false;
  SkipBranch  branch = SkipBranch::kNoRuleMatched;
  std::string reason;
};

struct ReprocessDecision {
  bool        reprocess = false;
  std::string reason;
};

/*
  Skip-or-reprocess decision for one ticket against one stage.

  Pure: looks only at the ticket's current record, the stage id and the
  stage's skip rules. First matching rule wins.
*/
class ReprocessingDecider {
 public:
  static SkipDecision ShouldSkip(const std::optional<db::model::GeocodeRecord>& current, const std::string& stage_id,
                                 const SkipRules& rules);

  static ReprocessDecision ShouldReprocessByQuality(model::QualityTier tier, std::optional<quality::ReprocessThreshold> threshold,
                                                    bool locked);

  // "SKIP: <reason>" or "REPROCESS: <reason>"
  static std::string Explain(const SkipDecision& decision);
};

} // namespace geocache::reprocess
