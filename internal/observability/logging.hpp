#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace taskvault::runtime::config {
class RuntimeConfig;
}

namespace taskvault::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

/*
  Installs the process logger.

  Logs go to stderr so that command output on stdout stays machine
  readable. TASKVAULT_LOG_LEVEL / TASKVAULT_LOG_PATTERN override config.
*/
void InitializeLogging(const taskvault::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace taskvault::observability

#define TASKVAULT_LOG_INFO(message, ...) ::taskvault::observability::LogInfo((message), ##__VA_ARGS__)
#define TASKVAULT_LOG_WARN(message, ...) ::taskvault::observability::LogWarn((message), ##__VA_ARGS__)
#define TASKVAULT_LOG_ERROR(message, ...) ::taskvault::observability::LogError((message), ##__VA_ARGS__)
