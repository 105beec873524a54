#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace geocache::runtime::config {
class RuntimeConfig;
}

namespace geocache::observability {

// Both return false when the signal is disabled or the build has no OpenTelemetry.
bool InitializeTracing(const geocache::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const geocache::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  RAII span around a pipeline run or stage. Ends on destruction.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Pipeline metrics.

  outcome is one of "skipped", "succeeded", "failed".
  tier is the quality tier name of a stored record.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordTicketOutcome(std::string_view stage, std::string_view outcome);
  void RecordStoredTier(std::string_view stage, std::string_view tier);
  void ObserveTicketLatencyMs(std::string_view stage, double latency_ms);
  void ObserveStageDurationMs(std::string_view stage, double duration_ms);
  void RecordStoreConflict();

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const geocache::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const geocache::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordTicketOutcome(std::string_view, std::string_view) {
}

inline void Metrics::RecordStoredTier(std::string_view, std::string_view) {
}

inline void Metrics::ObserveTicketLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveStageDurationMs(std::string_view, double) {
}

inline void Metrics::RecordStoreConflict() {
}
#endif

} // namespace geocache::observability
