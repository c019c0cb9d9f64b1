#pragma once

#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

#include "common/logging/logger.h"

namespace ferry::config {

// Simple INI line parser. Returns false for comments, blank lines, section
// headers and lines without '='; key and value come back trimmed.
bool parse_ini_value(const std::string& line, std::string& key, std::string& value);

// Section name for a "[name]" line, empty otherwise.
std::string get_current_section(const std::string& line);

// "true", "1" and "yes" are true; anything else is false.
bool parse_bool(const std::string& value);

// Helper to safely parse integer with validation
template <typename T>
bool safe_parse_int(const std::string& value, T& out, const std::string& field_name,
                    std::error_code& ec) {
  try {
    std::size_t consumed = 0;
    if constexpr (std::is_unsigned_v<T>) {
      // stoull accepts "-1" and wraps it
      if (!value.empty() && value[0] == '-') {
        LOG_ERROR("Configuration error: {} value '{}' cannot be negative", field_name, value);
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
      }
      unsigned long long parsed = std::stoull(value, &consumed);
      if (parsed > std::numeric_limits<T>::max()) {
        LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
      }
      out = static_cast<T>(parsed);
    } else {
      long long parsed = std::stoll(value, &consumed);
      if (parsed < std::numeric_limits<T>::min() || parsed > std::numeric_limits<T>::max()) {
        LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
      }
      out = static_cast<T>(parsed);
    }
    if (consumed != value.size()) {
      LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
      ec = std::make_error_code(std::errc::invalid_argument);
      return false;
    }
    return true;
  } catch (const std::invalid_argument&) {
    LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  } catch (const std::out_of_range&) {
    LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
    ec = std::make_error_code(std::errc::result_out_of_range);
    return false;
  }
}

bool safe_parse_double(const std::string& value, double& out, const std::string& field_name,
                       std::error_code& ec);

}  // namespace ferry::config
