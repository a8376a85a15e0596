#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace graphflow::runtime::config {
class RuntimeConfig;
}

namespace graphflow::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const graphflow::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

/*
  Fields appended to every line logged by the current thread while the
  scope is alive, e.g. the execution a worker is running a node for.
  Scopes nest; an inner scope's fields come after the outer ones.
*/
class ScopedLogFields {
 public:
  explicit ScopedLogFields(std::initializer_list<LogField> fields);
  ~ScopedLogFields();

  ScopedLogFields(const ScopedLogFields&)            = delete;
  ScopedLogFields& operator=(const ScopedLogFields&) = delete;

 private:
  std::size_t restore_size_;
};

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace graphflow::observability

#define GRAPHFLOW_LOG_DEBUG(message, ...) ::graphflow::observability::LogDebug((message), ##__VA_ARGS__)
#define GRAPHFLOW_LOG_INFO(message, ...) ::graphflow::observability::LogInfo((message), ##__VA_ARGS__)
#define GRAPHFLOW_LOG_WARN(message, ...) ::graphflow::observability::LogWarn((message), ##__VA_ARGS__)
#define GRAPHFLOW_LOG_ERROR(message, ...) ::graphflow::observability::LogError((message), ##__VA_ARGS__)
