#pragma once

#include <spdlog/common.h>
#include <spdlog/spdlog.h>

#include <string>
#include <string_view>

namespace tvlink::logging {

enum class LogLevel {
  trace,
  debug,
  info,
  warn,
  error,
  critical,
  off
};

LogLevel parse_log_level(std::string_view value);
spdlog::level::level_enum to_spdlog_level(LogLevel level);

// Installs the default "tvlink" logger. Console output goes to stdout or
// stderr; when file_path is non-empty records are also appended to it.
void configure_logging(LogLevel level, bool to_stdout, const std::string& file_path = {});

}  // namespace tvlink::logging

// Logging macros for convenience.
#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
