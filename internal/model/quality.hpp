#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace geocache::model {

/*
  Ordinal quality classification of a geocode result.

  Underlying values are ordered: a larger value is a better result,
  so tiers compare with the usual relational operators.
*/
enum class QualityTier : std::uint8_t {
  kFailed       = 0,
  kReviewNeeded = 1,
  kAcceptable   = 2,
  kGood         = 3,
  kExcellent    = 4,
};

/*
  Ordinal human-review urgency. A larger value is more urgent.
*/
enum class ReviewPriority : std::uint8_t {
  kNone     = 0,
  kLow      = 1,
  kMedium   = 2,
  kHigh     = 3,
  kCritical = 4,
};

enum class Severity : std::uint8_t {
  kInfo    = 0,
  kWarning = 1,
  kError   = 2,
};

constexpr std::string_view ToString(QualityTier tier) {
  switch (tier) {
    case QualityTier::kExcellent:
      return "EXCELLENT";
    case QualityTier::kGood:
      return "GOOD";
    case QualityTier::kAcceptable:
      return "ACCEPTABLE";
    case QualityTier::kReviewNeeded:
      return "REVIEW_NEEDED";
    case QualityTier::kFailed:
    default:
      return "FAILED";
  }
}

constexpr std::string_view ToString(ReviewPriority priority) {
  switch (priority) {
    case ReviewPriority::kCritical:
      return "CRITICAL";
    case ReviewPriority::kHigh:
      return "HIGH";
    case ReviewPriority::kMedium:
      return "MEDIUM";
    case ReviewPriority::kLow:
      return "LOW";
    case ReviewPriority::kNone:
    default:
      return "NONE";
  }
}

constexpr std::string_view ToString(Severity severity) {
  switch (severity) {
    case Severity::kError:
      return "ERROR";
    case Severity::kWarning:
      return "WARNING";
    case Severity::kInfo:
    default:
      return "INFO";
  }
}

constexpr std::optional<QualityTier> ParseQualityTier(std::string_view value) {
  if (value == "EXCELLENT") return QualityTier::kExcellent;
  if (value == "GOOD") return QualityTier::kGood;
  if (value == "ACCEPTABLE") return QualityTier::kAcceptable;
  if (value == "REVIEW_NEEDED") return QualityTier::kReviewNeeded;
  if (value == "FAILED") return QualityTier::kFailed;
  return std::nullopt;
}

constexpr std::optional<ReviewPriority> ParseReviewPriority(std::string_view value) {
  if (value == "CRITICAL") return ReviewPriority::kCritical;
  if (value == "HIGH") return ReviewPriority::kHigh;
  if (value == "MEDIUM") return ReviewPriority::kMedium;
  if (value == "LOW") return ReviewPriority::kLow;
  if (value == "NONE") return ReviewPriority::kNone;
  return std::nullopt;
}

} // namespace geocache::model
