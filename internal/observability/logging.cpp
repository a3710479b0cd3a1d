#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace stagesync::observability {
namespace {

constexpr const char* kLoggerName     = "stagesync";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%n] [%^%l%$] %v";
constexpr std::size_t kMaxFileBytes   = 16 * 1024 * 1024;
constexpr std::size_t kMaxFiles       = 4;

std::atomic<bool> g_include_trace_context{false};

// Environment overrides the config file; both fall back to the default.
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env)) return value;
  return configured.empty() ? fallback : configured;
}

bool TraceContextEnabled(const stagesync::runtime::config::LoggingConfig& config) {
  if (const char* value = std::getenv("STAGESYNC_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string text(value);
    return text == "1" || text == "true";
  }
  return config.include_trace_context();
}

void AppendField(std::string& line, const LogField& field) {
  line += ' ';
  line += field.key;
  line += '=';
  if (field.value.find_first_of(" \t\"") == std::string::npos) {
    line += field.value;
    return;
  }
  line += '"';
  for (char c : field.value) {
    if (c == '"' || c == '\\') line += '\\';
    line += c;
  }
  line += '"';
}

#ifdef ENABLE_OTEL
void AppendHex(std::string& line, const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    line += kHex[data[i] >> 4];
    line += kHex[data[i] & 0x0F];
  }
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;
  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_id[16];
  uint8_t span_id[8];
  context.trace_id().CopyBytesTo(trace_id);
  context.span_id().CopyBytesTo(span_id);

  line += " trace_id=";
  AppendHex(line, trace_id, sizeof(trace_id));
  line += " span_id=";
  AppendHex(line, span_id, sizeof(span_id));
}
#else
void AppendTraceContext(std::string&) {
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

LogField DurationField(std::string_view key, std::chrono::milliseconds value) {
  return {std::string(key), std::to_string(value.count()) + "ms"};
}

void InitializeLogging(const stagesync::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  const auto file_path = Setting("STAGESYNC_LOG_FILE", logging.file_path(), "");
  if (!file_path.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file_path, kMaxFileBytes, kMaxFiles));
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(Setting("STAGESYNC_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Setting("STAGESYNC_LOG_LEVEL", logging.level(), "info")));
  logger->flush_on(spdlog::level::warn);

  // Replaces the registry entry of the same name, so re-initializing is safe.
  spdlog::set_default_logger(logger);
  g_include_trace_context = TraceContextEnabled(logging);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger_raw();
  // Null after ShutdownLogging; late destructors may still log.
  if (!logger || !logger->should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) AppendField(line, field);
  AppendTraceContext(line);
  logger->log(level, "{}", line);
}

} // namespace stagesync::observability
