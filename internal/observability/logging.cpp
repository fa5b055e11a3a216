#include "internal/observability/logging.hpp"

#include <array>
#include <cstdlib>
#include <iterator>
#include <string>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace fraudit::observability {
namespace {

constexpr const char* kLoggerName     = "fraudit";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 9> kLevels = {{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"err", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

// Environment beats the config file, the config file beats the default.
std::string Setting(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name); value && *value) {
    return value;
  }
  return configured.empty() ? std::string(fallback) : configured;
}

bool NeedsQuotes(std::string_view value) {
  if (value.empty()) return true;
  for (const char c : value) {
    if (c == ' ' || c == '=' || c == '"' || c == '\t' || c == '\n') return true;
  }
  return false;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{}", value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

spdlog::level::level_enum ParseLogLevel(std::string_view text) {
  for (const auto& [name, level] : kLevels) {
    if (name == text) {
      return level;
    }
  }
  throw util::ValidationError("unknown log level: " + std::string(text));
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  fmt::memory_buffer out;
  for (const auto& field : fields) {
    if (out.size() > 0) {
      out.push_back(' ');
    }
    fmt::format_to(std::back_inserter(out), "{}=", field.key);
    if (!NeedsQuotes(field.value)) {
      out.append(field.value.data(), field.value.data() + field.value.size());
      continue;
    }
    out.push_back('"');
    for (const char c : field.value) {
      if (c == '"' || c == '\\') out.push_back('\\');
      out.push_back(c == '\n' ? ' ' : c);
    }
    out.push_back('"');
  }
  return fmt::to_string(out);
}

void InitializeLogging(const fraudit::config::RuntimeConfig& config) {
  const auto level   = ParseLogLevel(Setting("FRAUDIT_LOG_LEVEL", config.logging().level(), "info"));
  const auto pattern = Setting("FRAUDIT_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(pattern);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  // rule failures and fatal errors must reach the terminal before exit
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (!logger || !logger->should_log(level)) {
    return;
  }
  if (fields.size() == 0) {
    logger->log(level, "{}", message);
    return;
  }
  logger->log(level, "{} {}", message, FormatFields(fields));
}

} // namespace fraudit::observability
