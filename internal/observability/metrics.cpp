#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace geocache::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Attributes    = std::initializer_list<AttributePair>;

std::shared_ptr<sdkmetrics::MeterProvider> g_meter_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpConfig& otlp_config) {
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = otlp_config.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = otlp_config.endpoint;
  options.use_ssl_credentials = !otlp_config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// The SDK changed reader ownership and the context argument between releases.
template <typename Provider>
void AddReader(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value>
void Add(const opentelemetry::nostd::shared_ptr<Instrument>& counter, Value value, Attributes attributes) {
  if (!counter) return;
  if constexpr (requires { counter->Add(value, attributes, opentelemetry::context::Context{}); }) {
    counter->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    counter->Add(value, attributes);
  }
}

template <typename Instrument, typename Value>
void Record(const opentelemetry::nostd::shared_ptr<Instrument>& histogram, Value value, Attributes attributes) {
  if (!histogram) return;
  if constexpr (requires { histogram->Record(value, attributes, opentelemetry::context::Context{}); }) {
    histogram->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    histogram->Record(value, attributes);
  }
}

} // namespace

bool InitializeMetrics(const geocache::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ResolveOtlpConfig(config.observability(), OtlpSignal::kMetrics);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.collection_interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(otlp_config), reader_options);

  opentelemetry::sdk::resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_meter_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(),
                                                                 opentelemetry::sdk::resource::Resource::Create(attrs));
  AddReader(g_meter_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_meter_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_meter_provider) {
    g_meter_provider->ForceFlush();
    g_meter_provider->Shutdown();
    g_meter_provider.reset();
  }
}

// ------------------------------------------------------------------
// Metrics
// ------------------------------------------------------------------

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> ticket_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> stored_tiers;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> store_conflicts;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      ticket_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      stage_duration_ms;
};

// Instruments bind to the provider installed at first use.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("geocache.pipeline", "0.1.0");

  impl_->ticket_outcomes   = meter->CreateUInt64Counter("geocache.ticket.outcomes", "Tickets handled per stage by outcome", "1");
  impl_->stored_tiers      = meter->CreateUInt64Counter("geocache.record.tiers", "Stored record versions by quality tier", "1");
  impl_->store_conflicts   = meter->CreateUInt64Counter("geocache.store.conflicts", "Record store commit retries", "1");
  impl_->ticket_latency_ms = meter->CreateDoubleHistogram("geocache.ticket.latency_ms", "Per-ticket processing latency", "ms");
  impl_->stage_duration_ms = meter->CreateDoubleHistogram("geocache.stage.duration_ms", "Wall time of one stage over the batch", "ms");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordTicketOutcome(std::string_view stage, std::string_view outcome) {
  const std::string stage_value(stage);
  const std::string outcome_value(outcome);
  Add(impl_->ticket_outcomes, std::uint64_t{1}, {{"stage", stage_value}, {"outcome", outcome_value}});
}

void Metrics::RecordStoredTier(std::string_view stage, std::string_view tier) {
  const std::string stage_value(stage);
  const std::string tier_value(tier);
  Add(impl_->stored_tiers, std::uint64_t{1}, {{"stage", stage_value}, {"tier", tier_value}});
}

void Metrics::ObserveTicketLatencyMs(std::string_view stage, double latency_ms) {
  const std::string stage_value(stage);
  Record(impl_->ticket_latency_ms, latency_ms, {{"stage", stage_value}});
}

void Metrics::ObserveStageDurationMs(std::string_view stage, double duration_ms) {
  const std::string stage_value(stage);
  Record(impl_->stage_duration_ms, duration_ms, {{"stage", stage_value}});
}

void Metrics::RecordStoreConflict() {
  Add(impl_->store_conflicts, std::uint64_t{1}, {});
}

} // namespace geocache::observability

#endif
