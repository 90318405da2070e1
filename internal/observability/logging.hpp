#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace checkout::runtime::config {
class RuntimeConfig;
}

namespace checkout::observability {

/*
  Structured logging on top of spdlog.

  Every line is "<message> key=value key=value [trace_id=.. span_id=..]".
  Level and pattern come from RuntimeConfig.logging and can be overridden
  with CHECKOUT_LOG_LEVEL / CHECKOUT_LOG_PATTERN /
  CHECKOUT_LOG_INCLUDE_TRACE_CONTEXT.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const checkout::runtime::config::RuntimeConfig& config);
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

} // namespace checkout::observability

#define CHECKOUT_LOG_DEBUG(message, ...) ::checkout::observability::LogDebug((message), ##__VA_ARGS__)
#define CHECKOUT_LOG_INFO(message, ...) ::checkout::observability::LogInfo((message), ##__VA_ARGS__)
#define CHECKOUT_LOG_WARN(message, ...) ::checkout::observability::LogWarn((message), ##__VA_ARGS__)
#define CHECKOUT_LOG_ERROR(message, ...) ::checkout::observability::LogError((message), ##__VA_ARGS__)
