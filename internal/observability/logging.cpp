#include "internal/observability/logging.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cstdlib>
#include <string>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace geocache::observability {
namespace {

constexpr const char* kLoggerName     = "geocache";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_include_trace_context{false};

// Environment first, then the config file, then the fallback.
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value && *value) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool IncludeTraceContext(const geocache::runtime::config::RuntimeConfig& config) {
  if (const char* value = std::getenv("GEOCACHE_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string flag(value);
    return flag == "1" || flag == "true";
  }
  return config.logging().include_trace_context();
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  return value.find_first_of(" \t\n\"=") != std::string_view::npos;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
template <std::size_t N>
std::string Hex(const std::array<uint8_t, N>& bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string           out;
  out.reserve(N * 2);
  for (uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

// trace_id/span_id of the active span, if any.
std::string TraceContext() {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) return {};

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return {};
  const auto context = span->GetContext();
  if (!context.IsValid()) return {};

  std::array<uint8_t, 16> trace_id{};
  std::array<uint8_t, 8>  span_id{};
  context.trace_id().CopyBytesTo(trace_id);
  context.span_id().CopyBytesTo(span_id);
  return fmt::format("trace_id={} span_id={}", Hex(trace_id), Hex(span_id));
}
#else
std::string TraceContext() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.3f}", value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

spdlog::level::level_enum ParseLevel(std::string_view name) {
  // from_str maps anything it does not know to "off"
  const auto level = spdlog::level::from_str(std::string(name));
  if (level == spdlog::level::off && name != "off") {
    throw util::ConfigurationError(fmt::format("logging.level: unknown level '{}'", name));
  }
  return level;
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out.append(field.key);
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

void InitializeLogging(const geocache::runtime::config::RuntimeConfig& config) {
  const auto level = ParseLevel(Setting("GEOCACHE_LOG_LEVEL", config.logging().level(), "info"));

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(Setting("GEOCACHE_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context.store(IncludeTraceContext(config), std::memory_order_relaxed);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& part : {FormatFields(fields), TraceContext()}) {
    if (part.empty()) continue;
    line.push_back(' ');
    line.append(part);
  }
  spdlog::log(level, "{}", line);
}

} // namespace geocache::observability
