#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace uplink::runtime::config {
class RuntimeConfig;
}

namespace uplink::observability {

/*
  Structured logging over the process-wide spdlog logger.

  Fields are appended as key=value; values with blanks or quotes are quoted.
  Output goes to stdout and, when logging.file (or UPLINK_LOG_FILE) is set,
  to a size-rotated file as well.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

void InitializeLogging(const uplink::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

bool ShouldLog(spdlog::level::level_enum level);

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

} // namespace uplink::observability

#define UPLINK_LOG_DEBUG(message, ...) ::uplink::observability::LogDebug((message), ##__VA_ARGS__)
#define UPLINK_LOG_INFO(message, ...) ::uplink::observability::LogInfo((message), ##__VA_ARGS__)
#define UPLINK_LOG_WARN(message, ...) ::uplink::observability::LogWarn((message), ##__VA_ARGS__)
#define UPLINK_LOG_ERROR(message, ...) ::uplink::observability::LogError((message), ##__VA_ARGS__)
