#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace fraudit::config {
class RuntimeConfig;
}

namespace fraudit::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// Names accepted in logging.level and FRAUDIT_LOG_LEVEL.
// Throws util::ValidationError for anything else.
spdlog::level::level_enum ParseLogLevel(std::string_view text);

// key=value pairs separated by spaces. Values that are empty or hold
// spaces, '=' or quotes are double-quoted with '"' and '\' escaped.
std::string FormatFields(std::initializer_list<LogField> fields);

// FRAUDIT_LOG_LEVEL and FRAUDIT_LOG_PATTERN override the config file.
void InitializeLogging(const fraudit::config::RuntimeConfig& config);
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

} // namespace fraudit::observability

#define FRAUDIT_LOG_DEBUG(message, ...) ::fraudit::observability::LogDebug((message), ##__VA_ARGS__)
#define FRAUDIT_LOG_INFO(message, ...) ::fraudit::observability::LogInfo((message), ##__VA_ARGS__)
#define FRAUDIT_LOG_WARN(message, ...) ::fraudit::observability::LogWarn((message), ##__VA_ARGS__)
#define FRAUDIT_LOG_ERROR(message, ...) ::fraudit::observability::LogError((message), ##__VA_ARGS__)
