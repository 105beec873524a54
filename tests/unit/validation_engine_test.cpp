#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/location.hpp"
#include "internal/util/geo.hpp"
#include "internal/validation/centroid_registry.hpp"
#include "internal/validation/validation_engine.hpp"

namespace {

using geocache::model::Coordinates;
using geocache::model::Severity;
using geocache::validation::CentroidRegistry;
using geocache::validation::ValidationEngine;
using geocache::validation::ValidationFlag;
using geocache::validation::ValidationInput;

ValidationEngine MakeEngine() {
  auto centroids = std::make_shared<const CentroidRegistry>(CentroidRegistry::Builtin());
  return ValidationEngine::WithDefaultRules({}, centroids);
}

// A well-placed, confident result near Kermit.
ValidationInput GoodInput() {
  ValidationInput input;
  input.coordinates  = Coordinates{31.86, -103.09};
  input.confidence   = 0.92;
  input.technique    = "ROAD_INTERSECTION";
  input.approach     = "intersection";
  input.street       = "Main St";
  input.intersection = "Oak Ave";
  input.city         = "Kermit";
  input.county       = "Winkler";
  input.ticket_type  = "Normal";
  return input;
}

const ValidationFlag* FindFlag(const std::vector<ValidationFlag>& flags, const std::string& code) {
  for (const auto& f : flags) {
    if (f.code == code) return &f;
  }
  return nullptr;
}

void TestCleanResultHasNoFlags() {
  const auto engine = MakeEngine();
  assert(engine.RuleCount() == 5);
  assert(engine.Validate(GoodInput()).empty());
}

void TestLowConfidenceWarning() {
  const auto engine = MakeEngine();
  auto       input  = GoodInput();
  input.confidence  = 0.50;

  const auto flags = engine.Validate(input);
  const auto* flag = FindFlag(flags, "low_confidence");
  assert(flag != nullptr);
  assert(flag->severity == Severity::kWarning);
  assert(flag->message == "Confidence 50.0% is below threshold 65.0%");
  assert(FindFlag(flags, "emergency_low_confidence") == nullptr);
}

void TestEmergencyTicketBelowElevatedThreshold() {
  const auto engine = MakeEngine();
  auto       input  = GoodInput();
  input.confidence  = 0.70;
  input.ticket_type = "Emergency";

  const auto flags = engine.Validate(input);
  const auto* flag = FindFlag(flags, "emergency_low_confidence");
  assert(flag != nullptr);
  assert(flag->severity == Severity::kError);
  // 0.70 is above the low-confidence threshold
  assert(FindFlag(flags, "low_confidence") == nullptr);
}

void TestDistanceFromCityCentroid() {
  const auto engine = MakeEngine();
  auto       input  = GoodInput();
  // Andrews, roughly 60km from Kermit
  input.coordinates = Coordinates{32.32, -102.55};

  const auto flags = engine.Validate(input);
  const auto* flag = FindFlag(flags, "distance_from_city");
  assert(flag != nullptr);
  assert(flag->severity == Severity::kWarning);

  // unknown city: no reference point, no flag
  input.city = "Odessa";
  assert(FindFlag(engine.Validate(input), "distance_from_city") == nullptr);
}

void TestApproachFlagsKeepRuleOrder() {
  const auto engine = MakeEngine();
  auto       input  = GoodInput();
  input.approach    = geocache::model::kFallbackApproach;
  input.confidence  = 0.35;

  const auto codes = ValidationEngine::Codes(engine.Validate(input));
  assert(codes.size() == 2);
  assert(codes[0] == "low_confidence");
  assert(codes[1] == "fallback_used");

  input.approach   = geocache::model::kPartialDataApproach;
  input.confidence = 0.80;
  const auto partial = ValidationEngine::Codes(engine.Validate(input));
  assert(partial.size() == 1);
  assert(partial[0] == "one_road_missing");
}

void TestMissingConfidenceSkipsConfidenceRules() {
  const auto engine = MakeEngine();
  auto       input  = GoodInput();
  input.confidence.reset();
  input.coordinates.reset();

  assert(engine.Validate(input).empty());
}

void TestCentroidRegistryLookup() {
  CentroidRegistry registry(CentroidRegistry::Builtin());
  assert(registry.Size() == 9);
  assert(registry.Find("kermit", "winkler").has_value());
  assert(!registry.Find("Kermit", "").has_value());

  registry.Add({"Kermit", "Winkler", {31.0, -103.0}});
  assert(registry.Size() == 9);
  assert(registry.Find("KERMIT", "WINKLER")->latitude == 31.0);

  const double d = geocache::util::HaversineKm({31.8576, -103.0930}, {32.3185, -102.5457});
  assert(d > 50.0 && d < 80.0);
}

} // namespace

int main() {
  TestCleanResultHasNoFlags();
  TestLowConfidenceWarning();
  TestEmergencyTicketBelowElevatedThreshold();
  TestDistanceFromCityCentroid();
  TestApproachFlagsKeepRuleOrder();
  TestMissingConfidenceSkipsConfidenceRules();
  TestCentroidRegistryLookup();

  std::cout << "geocache_unit_validation_engine: pass\n";
  return 0;
}
