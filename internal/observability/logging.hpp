#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace rowcast::runtime::config {
class RuntimeConfig;
}

namespace rowcast::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Long values (payload excerpts) are cut to max_len bytes with a "..." suffix.
LogField TruncatedField(std::string_view key, std::string_view value, std::size_t max_len = 120);

void InitializeLogging(const rowcast::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace rowcast::observability

#define ROWCAST_LOG_DEBUG(message, ...) ::rowcast::observability::LogDebug((message), ##__VA_ARGS__)
#define ROWCAST_LOG_INFO(message, ...) ::rowcast::observability::LogInfo((message), ##__VA_ARGS__)
#define ROWCAST_LOG_WARN(message, ...) ::rowcast::observability::LogWarn((message), ##__VA_ARGS__)
#define ROWCAST_LOG_ERROR(message, ...) ::rowcast::observability::LogError((message), ##__VA_ARGS__)
