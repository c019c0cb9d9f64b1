#include "client/client_config.h"

#include <filesystem>
#include <fstream>
#include <iostream>

#include <CLI/CLI.hpp>

#include "common/config/ini_reader.h"
#include "common/logging/logger.h"
#include "transfer/session/sender_session.h"

namespace ferry::client {

bool parse_args(int argc, char* argv[], ClientConfig& config, std::error_code& ec) {
  CLI::App app{"ferry transfer client"};

  // General options.
  app.add_option("-c,--config", config.config_file, "Configuration file path");
  app.add_flag("-v,--verbose", config.verbose, "Enable verbose logging");
  app.add_option("--log-file", config.log_file, "Also write the log to this file");

  // Server.
  app.add_option("-s,--server", config.server_address, "Server address")
      ->default_val("127.0.0.1");
  app.add_option("-p,--port", config.server_port, "Server port")->default_val(65432);
  std::uint32_t read_timeout_seconds = 30;
  app.add_option("--read-timeout", read_timeout_seconds,
                 "Seconds to wait for a server frame (0 waits forever)")
      ->default_val(30);

  // Transfer.
  app.add_option("file", config.input_file, "File to upload")->required();
  app.add_option("-o,--output", config.output_file,
                 "Where to save the received copy (default: <name>_received<ext>)");
  std::size_t chunk_size = 0;
  auto* chunk_option =
      app.add_option("--chunk-size", chunk_size, "Chunk size to request from the server");
  std::size_t retry_budget = 0;
  auto* budget_option = app.add_option("--retry-budget", retry_budget,
                                       "Retransmissions to allow (0 = twice the chunk count)");
  app.add_option("--max-retries", config.max_retries,
                 "Times to repeat a failed or mismatched upload")
      ->default_val(3);

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
  if (chunk_option->count() > 0) {
    config.chunk_size = chunk_size;
  }
  if (budget_option->count() > 0) {
    config.retry_budget = retry_budget;
  }

  // Load config file if specified.
  if (!config.config_file.empty()) {
    if (!load_config_file(config.config_file, config, ec)) {
      return false;
    }
  }

  if (config.output_file.empty()) {
    config.output_file = default_output_path(config.input_file);
  }
  return true;
}

bool load_config_file(const std::string& path, ClientConfig& config, std::error_code& ec) {
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

    if (section == "client" || section.empty()) {
      if (key == "server_address") {
        config.server_address = value;
      } else if (key == "server_port") {
        if (!config::safe_parse_int(value, config.server_port, "server_port", ec)) {
          return false;
        }
      } else if (key == "read_timeout") {
        std::uint32_t seconds = 0;
        if (!config::safe_parse_int(value, seconds, "read_timeout", ec)) {
          return false;
        }
        config.read_timeout = std::chrono::seconds(seconds);
      } else if (key == "max_retries") {
        if (!config::safe_parse_int(value, config.max_retries, "max_retries", ec)) {
          return false;
        }
      } else if (key == "verbose") {
        config.verbose = config::parse_bool(value);
      }
    } else if (section == "transfer") {
      if (key == "chunk_size") {
        std::size_t chunk_size = 0;
        if (!config::safe_parse_int(value, chunk_size, "chunk_size", ec)) {
          return false;
        }
        config.chunk_size = chunk_size;
      } else if (key == "retry_budget") {
        std::size_t budget = 0;
        if (!config::safe_parse_int(value, budget, "retry_budget", ec)) {
          return false;
        }
        config.retry_budget = budget;
      } else if (key == "output_file") {
        config.output_file = value;
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

bool validate_config(const ClientConfig& config, std::string& error) {
  if (config.server_address.empty()) {
    error = "Server address is required";
    return false;
  }

  if (config.server_port == 0) {
    error = "Invalid server port";
    return false;
  }

  if (config.input_file.empty()) {
    error = "Input file is required";
    return false;
  }

  if (config.chunk_size &&
      (*config.chunk_size < session::kMinChunkSize || *config.chunk_size > session::kMaxChunkSize)) {
    error = "Chunk size must be between " + std::to_string(session::kMinChunkSize) + " and " +
            std::to_string(session::kMaxChunkSize);
    return false;
  }

  if (config.max_retries > kMaxRetriesLimit) {
    error = "Max retries must be at most " + std::to_string(kMaxRetriesLimit);
    return false;
  }

  if (!config.output_file.empty() && config.output_file == config.input_file) {
    error = "Output file must differ from the input file";
    return false;
  }

  return true;
}

std::string default_output_path(const std::string& input_file) {
  const std::filesystem::path input(input_file);
  std::filesystem::path output = input.parent_path();
  output /= input.stem().string() + "_received" + input.extension().string();
  return output.string();
}

}  // namespace ferry::client
