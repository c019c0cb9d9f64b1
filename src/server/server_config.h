#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <system_error>

#include "transfer/session/sender_session.h"

namespace ferry::server {

// Server-specific configuration.
struct ServerConfig {
  // General settings.
  std::string config_file;
  bool verbose{false};
  std::string log_file;

  // Network.
  std::string listen_address{"127.0.0.1"};
  std::uint16_t listen_port{65432};
  std::size_t max_clients{64};
  // Applies to every read on a client connection; zero disables it.
  std::chrono::seconds read_timeout{30};

  // Transfer defaults and fault simulation; requests may override chunk size
  // and retry budget.
  session::SenderConfig transfer;

  // Finished-session records.
  std::chrono::seconds record_retention{60};
  std::chrono::seconds cleanup_interval{10};
};

// Parse command-line arguments into configuration. Values from a config file
// named with -c are applied after the flags and take precedence.
// ec == std::errc::operation_canceled after --help was printed.
bool parse_args(int argc, char* argv[], ServerConfig& config, std::error_code& ec);

// Load configuration from INI file.
bool load_config_file(const std::string& path, ServerConfig& config, std::error_code& ec);

// Validate configuration.
bool validate_config(const ServerConfig& config, std::string& error);

}  // namespace ferry::server
