#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace jobguard::observability {
namespace {

constexpr const char* kLoggerName     = "jobguard";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// Environment overrides config; config overrides the built-in default.
std::string Setting(const char* env_var, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_var)) return value;
  return configured.empty() ? fallback : configured;
}

// key=value pairs; values with spaces, quotes or '=' are quoted and escaped.
void AppendFields(std::string& line, std::initializer_list<LogField> fields) {
  for (const auto& field : fields) {
    line.push_back(' ');
    line += field.key;
    line.push_back('=');
    if (field.value.find_first_of(" \"=") == std::string::npos) {
      line += field.value;
      continue;
    }
    line.push_back('"');
    for (char c : field.value) {
      if (c == '"' || c == '\\') line.push_back('\\');
      line.push_back(c);
    }
    line.push_back('"');
  }
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
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

  auto trace_id = context.trace_id();
  auto span_id  = context.span_id();
  if (trace_id.IsValid() && span_id.IsValid()) {
    uint8_t trace_bytes[16];
    uint8_t span_bytes[8];
    trace_id.CopyBytesTo(trace_bytes);
    span_id.CopyBytesTo(span_bytes);
    return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
  }
  return {};
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

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.3f}", value)};
}

void InitializeLogging(const jobguard::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto logger = spdlog::get(kLoggerName);
  if (!logger) logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(Setting("JOBGUARD_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Setting("JOBGUARD_LOG_LEVEL", logging.level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  const auto trace_context = Setting("JOBGUARD_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context() ? "true" : "", "");
  g_include_trace_context  = trace_context == "1" || trace_context == "true";
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  AppendFields(line, fields);
  if (auto trace = TraceContextFields(); !trace.empty()) {
    line.push_back(' ');
    line += trace;
  }
  spdlog::log(level, "{}", line);
}

} // namespace jobguard::observability
