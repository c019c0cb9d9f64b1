#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace ferry::client {

inline constexpr std::uint32_t kMaxRetriesLimit = 100;

struct ClientConfig {
  // General settings.
  std::string config_file;
  bool verbose{false};
  std::string log_file;

  // Server.
  std::string server_address{"127.0.0.1"};
  std::uint16_t server_port{65432};
  // Zero disables the timeout.
  std::chrono::seconds read_timeout{30};

  // Transfer. Unset values leave the server's defaults in effect.
  std::string input_file;
  std::string output_file;
  std::optional<std::size_t> chunk_size;
  std::optional<std::size_t> retry_budget;
  // Whole-upload repeats after a failed or mismatched transfer.
  std::uint32_t max_retries{3};
};

// Parse command-line arguments into configuration. Values from a config file
// named with -c are applied after the flags and take precedence.
// ec == std::errc::operation_canceled after --help was printed.
bool parse_args(int argc, char* argv[], ClientConfig& config, std::error_code& ec);

// Load configuration from INI file.
bool load_config_file(const std::string& path, ClientConfig& config, std::error_code& ec);

// Validate configuration.
bool validate_config(const ClientConfig& config, std::string& error);

// "<dir>/<stem>_received<ext>" for an input path.
std::string default_output_path(const std::string& input_file);

}  // namespace ferry::client
