#pragma once

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace heritage::runtime::config {
class RuntimeConfig;
}

namespace heritage::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the stderr logger. Standard output is reserved for query results.

  Level precedence: HERITAGE_LOG_LEVEL, level_override, config.
*/
void InitializeLogging(const heritage::runtime::config::RuntimeConfig& config, std::string_view level_override = {});
void ShutdownLogging();

/*
  The process logger. Created on first use with a stderr sink at warn level
  when InitializeLogging has not run yet.
*/
std::shared_ptr<spdlog::logger> Logger();

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

} // namespace heritage::observability

#define HERITAGE_LOG_DEBUG(message, ...) ::heritage::observability::LogDebug((message), ##__VA_ARGS__)
#define HERITAGE_LOG_INFO(message, ...) ::heritage::observability::LogInfo((message), ##__VA_ARGS__)
#define HERITAGE_LOG_WARN(message, ...) ::heritage::observability::LogWarn((message), ##__VA_ARGS__)
#define HERITAGE_LOG_ERROR(message, ...) ::heritage::observability::LogError((message), ##__VA_ARGS__)
