#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace fleet::runtime::config {
class RuntimeConfig;
}

namespace fleet::observability {

/*
  Structured logging over spdlog.

  Messages are a fixed phrase followed by key=value fields, e.g.

    Job dispatched schedule_id=nightly robot_id=bot-2 affinity=soft wait=40s

  Level and pattern come from the logging section of RuntimeConfig,
  overridden by FLEET_LOG_LEVEL / FLEET_LOG_PATTERN.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);
// "40s" for whole seconds, "1500ms" otherwise.
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

// Accepts trace|debug|info|warn|warning|error|critical|off, any case.
// Throws util::InvalidArgument for anything else.
spdlog::level::level_enum ParseLogLevel(std::string_view name);

void InitializeLogging(const fleet::runtime::config::RuntimeConfig& config);
void SetLogLevel(std::string_view name);
void ShutdownLogging();

std::string FormatFields(std::initializer_list<LogField> fields);

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

} // namespace fleet::observability

#define FLEET_LOG_DEBUG(message, ...) ::fleet::observability::LogDebug((message), ##__VA_ARGS__)
#define FLEET_LOG_INFO(message, ...) ::fleet::observability::LogInfo((message), ##__VA_ARGS__)
#define FLEET_LOG_WARN(message, ...) ::fleet::observability::LogWarn((message), ##__VA_ARGS__)
#define FLEET_LOG_ERROR(message, ...) ::fleet::observability::LogError((message), ##__VA_ARGS__)
