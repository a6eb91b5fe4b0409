#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace livetv::runtime::config {
class RuntimeConfig;
}

namespace livetv::observability {

/*
  Key/value pair appended to a log line as key=value. Values holding
  spaces, quotes or '=' are quoted so lines stay machine-splittable.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField MillisField(std::string_view key, std::chrono::milliseconds value);

// Stream and database URLs carry secrets: userinfo, and for Xtream the
// /live/<user>/<pass>/ path segments. Always log them through this.
LogField UrlField(std::string_view key, std::string_view url);
std::string RedactUrl(std::string_view url);

std::string FormatFields(std::initializer_list<LogField> fields);

struct LogSettings {
  spdlog::level::level_enum level{spdlog::level::info};
  std::string               pattern{"%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"};
  bool                      trace_context{false};

  std::string file_path;
  std::size_t max_file_bytes{10 * 1024 * 1024};
  std::size_t max_files{3};
};

// Config values first, then LIVETV_LOG_LEVEL / LIVETV_LOG_PATTERN /
// LIVETV_LOG_INCLUDE_TRACE_CONTEXT from the environment on top.
LogSettings ResolveLogSettings(const livetv::runtime::config::RuntimeConfig& config);

void InitializeLogging(const LogSettings& settings);
void InitializeLogging(const livetv::runtime::config::RuntimeConfig& config);
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

} // namespace livetv::observability

#define LIVETV_LOG_DEBUG(message, ...) ::livetv::observability::LogDebug((message), ##__VA_ARGS__)
#define LIVETV_LOG_INFO(message, ...) ::livetv::observability::LogInfo((message), ##__VA_ARGS__)
#define LIVETV_LOG_WARN(message, ...) ::livetv::observability::LogWarn((message), ##__VA_ARGS__)
#define LIVETV_LOG_ERROR(message, ...) ::livetv::observability::LogError((message), ##__VA_ARGS__)
