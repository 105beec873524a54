#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace {

using geocache::observability::OtlpSignal;
using geocache::observability::OtlpTransport;
using geocache::observability::ResolveOtlpConfig;

void ClearOtelEnvironment() {
  ::unsetenv("OTEL_SERVICE_NAME");
  ::unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
}

void TestFieldFormatting() {
  using namespace geocache::observability;

  assert(FormatFields({}) == "");
  assert(FormatFields({StringField("stage", "city_centroid"), IntField("tickets", 40)}) == "stage=city_centroid tickets=40");
  assert(FormatFields({DoubleField("avg_ms", 1.5), BoolField("locked", true)}) == "avg_ms=1.500 locked=true");

  // lock reasons and error messages carry spaces and quotes
  assert(FormatFields({StringField("reason", "Locked (verified in field)")}) == "reason=\"Locked (verified in field)\"");
  assert(FormatFields({StringField("error", "bad \"road\"\nname")}) == "error=\"bad \\\"road\\\"\\nname\"");
  assert(FormatFields({StringField("ticket", "")}) == "ticket=\"\"");
}

void TestLevelParsing() {
  using geocache::observability::ParseLevel;

  assert(ParseLevel("debug") == spdlog::level::debug);
  assert(ParseLevel("info") == spdlog::level::info);
  assert(ParseLevel("off") == spdlog::level::off);

  bool threw = false;
  try {
    (void)ParseLevel("verbose");
  } catch (const geocache::util::ConfigurationError& ex) {
    threw = std::string(ex.what()) == "logging.level: unknown level 'verbose'";
  }
  assert(threw);
}

void TestOtlpDefaults() {
  ClearOtelEnvironment();
  geocache::runtime::config::ObservabilityConfig config;

  const auto traces = ResolveOtlpConfig(config, OtlpSignal::kTraces);
  assert(traces.transport == OtlpTransport::kGrpc);
  assert(traces.endpoint == "localhost:4317");
  assert(traces.service_name == "geocache");
  assert(traces.collection_interval_ms == 1000);

  config.set_transport(geocache::runtime::config::OTLP_TRANSPORT_HTTP);
  config.set_collection_interval_ms(250);
  assert(ResolveOtlpConfig(config, OtlpSignal::kTraces).endpoint == "http://localhost:4318/v1/traces");
  const auto metrics = ResolveOtlpConfig(config, OtlpSignal::kMetrics);
  assert(metrics.endpoint == "http://localhost:4318/v1/metrics");
  assert(metrics.collection_interval_ms == 250);
}

void TestOtlpEndpointPrecedence() {
  ClearOtelEnvironment();
  geocache::runtime::config::ObservabilityConfig config;

  ::setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "collector:4317", 1);
  assert(ResolveOtlpConfig(config, OtlpSignal::kMetrics).endpoint == "collector:4317");

  ::setenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "metrics-collector:4317", 1);
  assert(ResolveOtlpConfig(config, OtlpSignal::kMetrics).endpoint == "metrics-collector:4317");
  assert(ResolveOtlpConfig(config, OtlpSignal::kTraces).endpoint == "collector:4317");

  config.set_otlp_endpoint("configured:4317");
  assert(ResolveOtlpConfig(config, OtlpSignal::kMetrics).endpoint == "configured:4317");

  ::setenv("OTEL_SERVICE_NAME", "geocache-nightly", 1);
  assert(ResolveOtlpConfig(config, OtlpSignal::kTraces).service_name == "geocache-nightly");
  ClearOtelEnvironment();
}

void TestDisabledSignalsAreInert() {
  geocache::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("warn");

  geocache::observability::InitializeLogging(config);
  assert(!geocache::observability::InitializeTracing(config));
  assert(!geocache::observability::InitializeMetrics(config));

  // spans and instruments are safe to use without an exporter
  geocache::observability::SpanScope span("geocache.test");
  span.SetAttribute("stage", "fallback");
  span.SetAttribute("tickets", std::int64_t{3});
  span.RecordException("stage failed");
  geocache::observability::Metrics::Instance().RecordTicketOutcome("fallback", "failed");
  geocache::observability::Metrics::Instance().RecordStoredTier("fallback", "GOOD");
  GEOCACHE_LOG_INFO("suppressed below warn", {geocache::observability::StringField("stage", "fallback")});

  config.mutable_logging()->set_level("loud");
  bool threw = false;
  try {
    geocache::observability::InitializeLogging(config);
  } catch (const geocache::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  ::unsetenv("GEOCACHE_LOG_LEVEL");

  TestFieldFormatting();
  TestLevelParsing();
  TestOtlpDefaults();
  TestOtlpEndpointPrecedence();
  TestDisabledSignalsAreInert();

  std::cout << "geocache_unit_observability: pass\n";
  return 0;
}
