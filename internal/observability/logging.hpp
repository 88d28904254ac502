#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace reactor::runtime::config {
class RuntimeConfig;
}

namespace reactor::observability {

/*
  One key=value pair on a log line. Values containing whitespace,
  quotes or '=' are rendered double-quoted with escapes, so turn
  summaries and error texts stay one field.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UIntField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationField(std::string_view key, std::chrono::nanoseconds value); // rendered in ms

// Level and pattern: REACTOR_LOG_LEVEL / REACTOR_LOG_PATTERN, then config, then defaults.
void InitializeLogging(const reactor::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

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

} // namespace reactor::observability

#define REACTOR_LOG_DEBUG(message, ...) ::reactor::observability::LogDebug((message), ##__VA_ARGS__)
#define REACTOR_LOG_INFO(message, ...) ::reactor::observability::LogInfo((message), ##__VA_ARGS__)
#define REACTOR_LOG_WARN(message, ...) ::reactor::observability::LogWarn((message), ##__VA_ARGS__)
#define REACTOR_LOG_ERROR(message, ...) ::reactor::observability::LogError((message), ##__VA_ARGS__)
