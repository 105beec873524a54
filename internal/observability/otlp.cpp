#include "internal/observability/otlp.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace geocache::observability {
namespace {

const char* SignalEndpointVariable(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

std::string DefaultEndpoint(OtlpTransport transport, OtlpSignal signal) {
  if (transport == OtlpTransport::kGrpc) {
    return "localhost:4317";
  }
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace

OtlpConfig ResolveOtlpConfig(const geocache::runtime::config::ObservabilityConfig& config, OtlpSignal signal) {
  OtlpConfig resolved;
  resolved.transport =
      config.transport() == geocache::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (config.collection_interval_ms() > 0) {
    resolved.collection_interval_ms = config.collection_interval_ms();
  }
  if (const char* service = std::getenv("OTEL_SERVICE_NAME"); service && *service) {
    resolved.service_name = service;
  }

  if (!config.otlp_endpoint().empty()) {
    resolved.endpoint = config.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(SignalEndpointVariable(signal)); endpoint && *endpoint) {
    resolved.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT"); endpoint && *endpoint) {
    resolved.endpoint = endpoint;
  } else {
    resolved.endpoint = DefaultEndpoint(resolved.transport, signal);
  }
  return resolved;
}

} // namespace geocache::observability
