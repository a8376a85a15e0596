#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace graphflow::observability {
namespace {

constexpr const char* kLoggerName     = "graphflow";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

std::atomic<bool> g_include_trace_context{false};

thread_local std::vector<LogField> t_scoped_fields;

// env var wins over the config file, which wins over the built-in default
std::string Setting(const char* env_var, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_var); value && *value) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool TraceContextEnabled(const graphflow::runtime::config::LoggingConfig& logging) {
  if (const char* value = std::getenv("GRAPHFLOW_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string flag(value);
    return flag == "1" || flag == "true";
  }
  return logging.include_trace_context();
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  // from_str maps anything it does not know to "off"
  if (level == spdlog::level::off && name != "off") {
    spdlog::warn("unknown log level '{}', using info", name);
    return spdlog::level::info;
  }
  return level;
}

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\n' || c == '\t') return true;
  }
  return false;
}

void AppendField(std::ostringstream& out, const LogField& field) {
  out << ' ' << field.key << '=';
  if (!NeedsQuoting(field.value)) {
    out << field.value;
    return;
  }
  out << '"';
  for (char c : field.value) {
    switch (c) {
      case '"':
        out << "\\\"";
        break;
      case '\\':
        out << "\\\\";
        break;
      case '\n':
        out << "\\n";
        break;
      case '\t':
        out << "\\t";
        break;
      default:
        out << c;
    }
  }
  out << '"';
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

void AppendTraceContext(std::ostringstream& out) {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  out << " trace_id=" << HexId(trace_bytes, 16) << " span_id=" << HexId(span_bytes, 8);
}
#else
void AppendTraceContext(std::ostringstream&) {
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
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const graphflow::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  // tests and tools may initialize more than once
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(Setting("GRAPHFLOW_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(ParseLevel(Setting("GRAPHFLOW_LOG_LEVEL", logging.level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  g_include_trace_context.store(TraceContextEnabled(logging), std::memory_order_relaxed);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger_raw();
  if (!logger->should_log(level)) return;

  std::ostringstream out;
  out << message;
  for (const auto& field : fields) AppendField(out, field);
  for (const auto& field : t_scoped_fields) AppendField(out, field);
  AppendTraceContext(out);

  logger->log(level, "{}", out.str());
}

ScopedLogFields::ScopedLogFields(std::initializer_list<LogField> fields) : restore_size_(t_scoped_fields.size()) {
  t_scoped_fields.insert(t_scoped_fields.end(), fields.begin(), fields.end());
}

ScopedLogFields::~ScopedLogFields() {
  t_scoped_fields.resize(restore_size_);
}

} // namespace graphflow::observability
