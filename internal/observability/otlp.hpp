#pragma once

#include <cstdint>
#include <string>

namespace geocache::runtime::config {
class ObservabilityConfig;
}

namespace geocache::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpConfig {
  std::string   service_name{"geocache"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t collection_interval_ms{1000};
};

/*
  Resolves exporter settings for one signal.

  Endpoint precedence: the configured endpoint, then
  OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT,
  then the collector default for the transport. OTEL_SERVICE_NAME overrides
  the service name.
*/
OtlpConfig ResolveOtlpConfig(const geocache::runtime::config::ObservabilityConfig& config, OtlpSignal signal);

} // namespace geocache::observability
