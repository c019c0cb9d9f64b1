#include "server/server_config.h"

#include <arpa/inet.h>

#include <fstream>
#include <iostream>

#include <CLI/CLI.hpp>

#include "common/config/ini_reader.h"
#include "common/logging/logger.h"

namespace ferry::server {

namespace {
// Helper to validate IPv4 address format
bool is_valid_ipv4(const std::string& ip) {
  struct in_addr addr;
  return inet_pton(AF_INET, ip.c_str(), &addr) == 1;
}

bool parse_seconds(const std::string& value, std::chrono::seconds& out,
                   const std::string& field_name, std::error_code& ec) {
  std::uint32_t seconds = 0;
  if (!config::safe_parse_int(value, seconds, field_name, ec)) {
    return false;
  }
  out = std::chrono::seconds(seconds);
  return true;
}
}  // namespace

bool parse_args(int argc, char* argv[], ServerConfig& config, std::error_code& ec) {
  CLI::App app{"ferry transfer server"};

  // General options.
  app.add_option("-c,--config", config.config_file, "Configuration file path");
  app.add_flag("-v,--verbose", config.verbose, "Enable verbose logging");
  app.add_option("--log-file", config.log_file, "Also write the log to this file");

  // Network.
  app.add_option("-l,--listen", config.listen_address, "Listen address")
      ->default_val("127.0.0.1");
  app.add_option("-p,--port", config.listen_port, "Listen port")->default_val(65432);
  app.add_option("--max-clients", config.max_clients, "Maximum concurrent connections")
      ->default_val(64);
  std::uint32_t read_timeout_seconds = 30;
  app.add_option("--read-timeout", read_timeout_seconds,
                 "Seconds to wait for a client frame (0 waits forever)")
      ->default_val(30);

  // Transfer.
  app.add_option("--chunk-size", config.transfer.chunk_size, "Default chunk size in bytes")
      ->default_val(1024);
  app.add_option("--retry-budget", config.transfer.retry_budget,
                 "Retransmissions allowed per transfer (0 = twice the chunk count)")
      ->default_val(0);

  // Fault simulation.
  app.add_flag("--simulate-errors", config.transfer.fault.enabled,
               "Drop and corrupt chunks on purpose");
  app.add_option("--error-rate", config.transfer.fault.rate, "Probability of a faulted chunk")
      ->default_val(0.1);
  std::uint64_t fault_seed = 0;
  auto* seed_option =
      app.add_option("--fault-seed", fault_seed, "Seed for reproducible fault injection");

  // Session records.
  std::uint32_t retention_seconds = 60;
  app.add_option("--record-retention", retention_seconds,
                 "Seconds a finished session stays queryable")
      ->default_val(60);
  std::uint32_t cleanup_seconds = 10;
  app.add_option("--cleanup-interval", cleanup_seconds, "Seconds between record sweeps")
      ->default_val(10);

  try {
    app.parse(argc, argv);
  } catch (const CLI::CallForHelp&) {
    std::cout << app.help();
    ec = std::make_error_code(std::errc::operation_canceled);
    return false;
  } catch (const CLI::ParseError& e) {
    std::cerr << e.what() << '\n';
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  config.read_timeout = std::chrono::seconds(read_timeout_seconds);
  config.record_retention = std::chrono::seconds(retention_seconds);
  config.cleanup_interval = std::chrono::seconds(cleanup_seconds);
  if (seed_option->count() > 0) {
    config.transfer.fault.seed = fault_seed;
  }

  // Load config file if specified.
  if (!config.config_file.empty()) {
    if (!load_config_file(config.config_file, config, ec)) {
      return false;
    }
  }

  return true;
}

bool load_config_file(const std::string& path, ServerConfig& config, std::error_code& ec) {
  std::ifstream file(path);
  if (!file) {
    ec = std::error_code(errno, std::generic_category());
    LOG_ERROR("Failed to open config file: {}", path);
    return false;
  }

  std::string line;
  std::string section;

  while (std::getline(file, line)) {
    std::string new_section = config::get_current_section(line);
    if (!new_section.empty()) {
      section = new_section;
      continue;
    }

    std::string key;
    std::string value;
    if (!config::parse_ini_value(line, key, value)) {
      continue;
    }

    if (section == "server" || section.empty()) {
      if (key == "listen_address") {
        config.listen_address = value;
      } else if (key == "listen_port") {
        if (!config::safe_parse_int(value, config.listen_port, "listen_port", ec)) {
          return false;
        }
      } else if (key == "max_clients") {
        if (!config::safe_parse_int(value, config.max_clients, "max_clients", ec)) {
          return false;
        }
      } else if (key == "read_timeout") {
        if (!parse_seconds(value, config.read_timeout, "read_timeout", ec)) {
          return false;
        }
      } else if (key == "verbose") {
        config.verbose = config::parse_bool(value);
      }
    } else if (section == "transfer") {
      if (key == "chunk_size") {
        if (!config::safe_parse_int(value, config.transfer.chunk_size, "chunk_size", ec)) {
          return false;
        }
      } else if (key == "retry_budget") {
        if (!config::safe_parse_int(value, config.transfer.retry_budget, "retry_budget", ec)) {
          return false;
        }
      }
    } else if (section == "faults") {
      if (key == "simulate_errors") {
        config.transfer.fault.enabled = config::parse_bool(value);
      } else if (key == "error_rate") {
        if (!config::safe_parse_double(value, config.transfer.fault.rate, "error_rate", ec)) {
          return false;
        }
      } else if (key == "seed") {
        std::uint64_t seed = 0;
        if (!config::safe_parse_int(value, seed, "seed", ec)) {
          return false;
        }
        config.transfer.fault.seed = seed;
      }
    } else if (section == "sessions") {
      if (key == "record_retention") {
        if (!parse_seconds(value, config.record_retention, "record_retention", ec)) {
          return false;
        }
      } else if (key == "cleanup_interval") {
        if (!parse_seconds(value, config.cleanup_interval, "cleanup_interval", ec)) {
          return false;
        }
      }
    } else if (section == "logging") {
      if (key == "log_file") {
        config.log_file = value;
      } else if (key == "verbose") {
        config.verbose = config::parse_bool(value);
      }
    }
  }

  LOG_DEBUG("Loaded configuration from {}", path);
  return true;
}

bool validate_config(const ServerConfig& config, std::string& error) {
  if (config.listen_port == 0) {
    error = "Invalid listen port";
    return false;
  }

  if (!config.listen_address.empty() && !is_valid_ipv4(config.listen_address)) {
    error = "Listen address is not a valid IPv4 address: " + config.listen_address;
    return false;
  }

  if (config.max_clients == 0) {
    error = "Max clients must be greater than 0";
    return false;
  }

  // Limit max_clients to prevent resource exhaustion
  constexpr std::size_t kMaxClientsLimit = 10000;
  if (config.max_clients > kMaxClientsLimit) {
    error = "Max clients cannot exceed " + std::to_string(kMaxClientsLimit);
    return false;
  }

  if (config.transfer.chunk_size < session::kMinChunkSize ||
      config.transfer.chunk_size > session::kMaxChunkSize) {
    error = "Chunk size must be between " + std::to_string(session::kMinChunkSize) + " and " +
            std::to_string(session::kMaxChunkSize);
    return false;
  }

  if (!(config.transfer.fault.rate >= 0.0 && config.transfer.fault.rate <= 1.0)) {
    error = "Error rate must be between 0 and 1";
    return false;
  }

  if (config.cleanup_interval.count() == 0) {
    error = "Cleanup interval must be greater than 0";
    return false;
  }

  return true;
}

}  // namespace ferry::server
