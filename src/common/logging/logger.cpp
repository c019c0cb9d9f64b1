#include "common/logging/logger.h"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ferry::logging {

namespace {
spdlog::level::level_enum to_spdlog(LogLevel level) {
  switch (level) {
    case LogLevel::trace:
      return spdlog::level::trace;
    case LogLevel::debug:
      return spdlog::level::debug;
    case LogLevel::info:
      return spdlog::level::info;
    case LogLevel::warn:
      return spdlog::level::warn;
    case LogLevel::error:
      return spdlog::level::err;
    case LogLevel::critical:
      return spdlog::level::critical;
    case LogLevel::off:
      return spdlog::level::off;
  }
  return spdlog::level::info;
}
}  // namespace

void configure_logging(LogLevel level, bool console, const std::string& log_file) {
  std::vector<spdlog::sink_ptr> sinks;
  if (console) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  std::string file_error;
  if (!log_file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
    } catch (const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  auto logger = std::make_shared<spdlog::logger>("ferry", sinks.begin(), sinks.end());
  logger->set_level(to_spdlog(level));
  logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [t%t] %v");
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
  spdlog::set_level(to_spdlog(level));

  if (!file_error.empty()) {
    LOG_WARN("Cannot open log file {}: {}", log_file, file_error);
  }
}

bool parse_log_level(const std::string& name, LogLevel& out) {
  if (name == "trace") {
    out = LogLevel::trace;
  } else if (name == "debug") {
    out = LogLevel::debug;
  } else if (name == "info") {
    out = LogLevel::info;
  } else if (name == "warn" || name == "warning") {
    out = LogLevel::warn;
  } else if (name == "error") {
    out = LogLevel::error;
  } else if (name == "critical") {
    out = LogLevel::critical;
  } else if (name == "off") {
    out = LogLevel::off;
  } else {
    return false;
  }
  return true;
}

}  // namespace ferry::logging
