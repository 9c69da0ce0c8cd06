#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace rackwise::runtime::config {
class LoggingConfig;
}

namespace rackwise::observability {

/*
  Structured logging on top of spdlog.

  Messages are a fixed phrase followed by key=value fields; values holding
  spaces, quotes or '=' are double-quoted so lines stay machine-splittable.
  Until InitializeLogging runs, records go to the spdlog default logger.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField SizeField(std::string_view key, std::size_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// Throws std::invalid_argument for an unknown level name.
void InitializeLogging(const rackwise::runtime::config::LoggingConfig& config);
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

} // namespace rackwise::observability

#define RACKWISE_LOG_DEBUG(message, ...) ::rackwise::observability::LogDebug((message), ##__VA_ARGS__)
#define RACKWISE_LOG_INFO(message, ...) ::rackwise::observability::LogInfo((message), ##__VA_ARGS__)
#define RACKWISE_LOG_WARN(message, ...) ::rackwise::observability::LogWarn((message), ##__VA_ARGS__)
#define RACKWISE_LOG_ERROR(message, ...) ::rackwise::observability::LogError((message), ##__VA_ARGS__)
