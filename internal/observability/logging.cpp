#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace uplink::observability {
namespace {

constexpr const char* kLoggerName       = "segment-uplink";
constexpr const char* kDefaultPattern   = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";
constexpr std::size_t kDefaultFileBytes = 300 * 1024 * 1024;
constexpr std::size_t kDefaultFiles     = 3;

// environment wins over the config file
std::string FromEnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

std::vector<spdlog::sink_ptr> BuildSinks(const uplink::runtime::config::LoggingConfig& logging) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  const auto file = FromEnvOr("UPLINK_LOG_FILE", logging.file(), "");
  if (!file.empty()) {
    const std::size_t max_bytes = logging.max_file_bytes() > 0 ? logging.max_file_bytes() : kDefaultFileBytes;
    const std::size_t max_files = logging.max_files() > 0 ? logging.max_files() : kDefaultFiles;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, max_bytes, max_files));
  }
  return sinks;
}

bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
}

void AppendField(std::string& out, const LogField& field) {
  out += field.key;
  out += '=';
  if (!NeedsQuoting(field.value)) {
    out += field.value;
    return;
  }

  out += '"';
  for (char c : field.value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out += ' ';
    AppendField(out, field);
  }
  return out;
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

LogField DurationField(std::string_view key, std::chrono::milliseconds value) {
  return {std::string(key), std::to_string(value.count()) + "ms"};
}

void InitializeLogging(const uplink::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();
  auto        sinks   = BuildSinks(logging);

  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(FromEnvOr("UPLINK_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(FromEnvOr("UPLINK_LOG_LEVEL", logging.level(), "info")));
  logger->flush_on(spdlog::level::warn);

  spdlog::set_default_logger(std::move(logger));
}

void ShutdownLogging() {
  if (auto logger = spdlog::default_logger()) {
    logger->flush();
  }
  spdlog::shutdown();
}

bool ShouldLog(spdlog::level::level_enum level) {
  auto* logger = spdlog::default_logger_raw();
  return logger != nullptr && logger->should_log(level);
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!ShouldLog(level)) {
    return;
  }

  if (fields.size() == 0) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, SerializeFields(fields));
}

} // namespace uplink::observability
