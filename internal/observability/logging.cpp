#include "internal/observability/logging.hpp"

#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace arena::observability {
namespace {

constexpr const char* kLoggerName = "bid-arena";

std::string ResolveLevel(const arena::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("ARENA_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const arena::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("ARENA_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

bool ResolveTraceContextEnabled(const arena::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("ARENA_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.logging().include_trace_context();
}

bool                     g_include_trace_context{false};
thread_local std::string t_run_id;

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  if (!t_run_id.empty()) {
    out << "run_id=" << t_run_id;
    first = false;
  }
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    // Quote values that would break key=value parsing.
    if (field.value.empty() || field.value.find_first_of(" \t\"=") != std::string::npos) {
      out << '"';
      for (char c : field.value) {
        if (c == '"' || c == '\\') out << '\\';
        out << c;
      }
      out << '"';
    } else {
      out << field.value;
    }
  }
  return out.str();
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
std::string TraceContextFields() {
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
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.6g", value);
  return {std::string(key), buffer};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const arena::runtime::config::RuntimeConfig& config, LogSink sink) {
  // Re-initialisation (tests, tools) replaces the previous logger.
  spdlog::drop(kLoggerName);
  auto logger = sink == LogSink::kStderr ? spdlog::stderr_color_mt(kLoggerName) : spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  auto serialized_fields = SerializeFields(fields);
  auto trace_fields      = TraceContextFields();

  if (!serialized_fields.empty() && !trace_fields.empty()) {
    spdlog::log(level, "{} {} {}", message, serialized_fields, trace_fields);
    return;
  }
  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  if (!trace_fields.empty()) {
    spdlog::log(level, "{} {}", message, trace_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

RunLogScope::RunLogScope(std::string run_id) : previous_(std::move(t_run_id)) {
  t_run_id = std::move(run_id);
}

RunLogScope::~RunLogScope() {
  t_run_id = std::move(previous_);
}

} // namespace arena::observability
