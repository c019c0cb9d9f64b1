#include "common/config/ini_reader.h"

namespace ferry::config {

namespace {
void trim(std::string& text) {
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
    text.pop_back();
  }
  std::size_t start = 0;
  while (start < text.size() && (text[start] == ' ' || text[start] == '\t')) {
    ++start;
  }
  text.erase(0, start);
}
}  // namespace

bool parse_ini_value(const std::string& line, std::string& key, std::string& value) {
  std::string trimmed = line;
  trim(trimmed);
  if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';' || trimmed[0] == '[') {
    return false;
  }

  auto pos = trimmed.find('=');
  if (pos == std::string::npos) {
    return false;
  }

  key = trimmed.substr(0, pos);
  value = trimmed.substr(pos + 1);
  trim(key);
  trim(value);
  return !key.empty();
}

std::string get_current_section(const std::string& line) {
  std::string trimmed = line;
  trim(trimmed);
  if (trimmed.size() >= 2 && trimmed.front() == '[' && trimmed.back() == ']') {
    return trimmed.substr(1, trimmed.size() - 2);
  }
  return "";
}

bool parse_bool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

bool safe_parse_double(const std::string& value, double& out, const std::string& field_name,
                       std::error_code& ec) {
  try {
    std::size_t consumed = 0;
    double parsed = std::stod(value, &consumed);
    if (consumed != value.size()) {
      LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
      ec = std::make_error_code(std::errc::invalid_argument);
      return false;
    }
    out = parsed;
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

}  // namespace ferry::config
