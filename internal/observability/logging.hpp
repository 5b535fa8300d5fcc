#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace tgstats::runtime::config {
class RuntimeConfig;
}

namespace tgstats::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the "tgstats" stderr logger as spdlog's default. Safe to call more
  than once; the later call replaces the earlier logger, which lets main()
  log with defaults before the config file has been read.
*/
void InitializeLogging(const tgstats::runtime::config::RuntimeConfig& config);
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

} // namespace tgstats::observability

#define TGSTATS_LOG_DEBUG(message, ...) ::tgstats::observability::LogDebug((message), ##__VA_ARGS__)
#define TGSTATS_LOG_INFO(message, ...) ::tgstats::observability::LogInfo((message), ##__VA_ARGS__)
#define TGSTATS_LOG_WARN(message, ...) ::tgstats::observability::LogWarn((message), ##__VA_ARGS__)
#define TGSTATS_LOG_ERROR(message, ...) ::tgstats::observability::LogError((message), ##__VA_ARGS__)
