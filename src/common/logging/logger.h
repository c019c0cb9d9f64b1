#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace ferry::logging {

enum class LogLevel { trace, debug, info, warn, error, critical, off };

// Install the default logger.
// The console sink writes colored output to stderr; a non-empty log_file adds
// a plain file sink next to it. Safe to call more than once: the previous
// default logger is replaced.
void configure_logging(LogLevel level, bool console, const std::string& log_file = {});

// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
bool parse_log_level(const std::string& name, LogLevel& out);

}  // namespace ferry::logging

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
