#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace cloudsim::runtime::config {
class RuntimeConfig;
}

namespace cloudsim::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Level and pattern come from CLOUDSIM_LOG_LEVEL / CLOUDSIM_LOG_PATTERN, then
// config, then built-in defaults. Throws std::runtime_error on an unknown level.
void InitializeLogging(const cloudsim::runtime::config::RuntimeConfig& config);

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

} // namespace cloudsim::observability

#define CLOUDSIM_LOG_DEBUG(message, ...) ::cloudsim::observability::LogDebug((message), ##__VA_ARGS__)
#define CLOUDSIM_LOG_INFO(message, ...) ::cloudsim::observability::LogInfo((message), ##__VA_ARGS__)
#define CLOUDSIM_LOG_WARN(message, ...) ::cloudsim::observability::LogWarn((message), ##__VA_ARGS__)
#define CLOUDSIM_LOG_ERROR(message, ...) ::cloudsim::observability::LogError((message), ##__VA_ARGS__)
