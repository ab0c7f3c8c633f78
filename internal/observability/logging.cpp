#include "internal/observability/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/span.h>
#endif

namespace caretask::observability {
namespace {

constexpr const char* kLoggerName     = "caretask";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Environment overrides the YAML logging section.
struct LoggingSettings {
  std::string level;
  std::string pattern;
  bool        trace_context = false;
};

std::string FromEnvOr(const char* variable, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(variable)) return value;
  return configured.empty() ? fallback : configured;
}

LoggingSettings ResolveSettings(const caretask::runtime::config::RuntimeConfig& config) {
  LoggingSettings settings;
  settings.level   = FromEnvOr("CARETASK_LOG_LEVEL", config.logging().level(), kDefaultLevel);
  settings.pattern = FromEnvOr("CARETASK_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  if (const char* value = std::getenv("CARETASK_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string flag(value);
    settings.trace_context = flag == "1" || flag == "true";
  } else {
    settings.trace_context = config.logging().include_trace_context();
  }
  return settings;
}

bool g_include_trace_context = false;

// key=value, quoted when the value holds spaces (descriptions usually do)
void AppendField(std::string& line, const LogField& field) {
  line += ' ';
  line += field.key;
  line += '=';
  if (field.value.find_first_of(" \t\"") == std::string::npos) {
    line += field.value;
    return;
  }
  line += '"';
  for (const char c : field.value) {
    if (c == '"' || c == '\\') line += '\\';
    line += c;
  }
  line += '"';
}

void AppendTraceContext(std::string& line) {
#ifdef ENABLE_OTEL
  if (!g_include_trace_context) return;

  const auto span    = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  line += " trace_id=";
  line.append(trace_id, sizeof(trace_id));
  line += " span_id=";
  line.append(span_id, sizeof(span_id));
#else
  (void)line;
#endif
}

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

void InitializeLogging(const caretask::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config);

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(spdlog::level::from_str(settings.level));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_include_trace_context = settings.trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (!logger->should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  AppendTraceContext(line);
  logger->log(level, "{}", line);
}

} // namespace caretask::observability
