#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace heritage::observability {
namespace {

constexpr const char* kLoggerName = "heritage-pathfind";

std::string ResolveLevel(const heritage::runtime::config::RuntimeConfig& config, std::string_view level_override) {
  if (const char* level = std::getenv("HERITAGE_LOG_LEVEL")) {
    return level;
  }

  if (!level_override.empty()) {
    return std::string(level_override);
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "warn";
}

std::string ResolvePattern(const heritage::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("HERITAGE_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

std::shared_ptr<spdlog::logger> Logger() {
  if (auto logger = spdlog::get(kLoggerName)) {
    return logger;
  }

  // library use without InitializeLogging still stays off stdout
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(ResolvePattern(heritage::runtime::config::RuntimeConfig()));
  logger->set_level(spdlog::level::warn);
  return logger;
}

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const heritage::runtime::config::RuntimeConfig& config, std::string_view level_override) {
  auto logger = Logger();
  logger->set_pattern(ResolvePattern(config));

  // from_str maps anything it does not know to "off"
  const auto level_name = ResolveLevel(config, level_override);
  auto       level      = spdlog::level::from_str(level_name);
  const bool unknown    = level == spdlog::level::off && level_name != "off";
  if (unknown) {
    level = spdlog::level::warn;
  }

  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (unknown) {
    LogWarn("Unknown log level, using warn", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  auto logger            = Logger();

  if (!serialized_fields.empty()) {
    logger->log(level, "{} {}", message, serialized_fields);
    return;
  }
  logger->log(level, "{}", message);
}

} // namespace heritage::observability
