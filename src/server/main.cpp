#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <thread>

#include "common/crypto/digest.h"
#include "common/logging/logger.h"
#include "server/server_config.h"
#include "server/transfer_server.h"

using namespace ferry;

namespace {
std::atomic<int> g_signal{0};

void on_signal(int signo) { g_signal.store(signo); }

void print_configuration(const server::ServerConfig& config) {
  LOG_INFO("Configuration:");
  LOG_INFO("  listen         {}:{}", config.listen_address, config.listen_port);
  LOG_INFO("  chunk size     {} bytes", config.transfer.chunk_size);
  if (config.transfer.retry_budget == 0) {
    LOG_INFO("  retry budget   2 x chunk count");
  } else {
    LOG_INFO("  retry budget   {}", config.transfer.retry_budget);
  }
  LOG_INFO("  max clients    {}", config.max_clients);
  LOG_INFO("  read timeout   {}s", config.read_timeout.count());
  LOG_INFO("  faults         {}", config.transfer.fault.enabled ? "enabled" : "disabled");
  if (config.transfer.fault.enabled) {
    LOG_INFO("  error rate     {:.2f}", config.transfer.fault.rate);
    if (config.transfer.fault.seed) {
      LOG_INFO("  fault seed     {}", *config.transfer.fault.seed);
    }
  }
  LOG_INFO("  retention      {}s (sweep every {}s)", config.record_retention.count(),
           config.cleanup_interval.count());
}

void print_statistics(const server::ServerStats& stats) {
  LOG_INFO("Connections: {} total, {} active, {} rejected", stats.connections_total,
           stats.connections_active, stats.connections_rejected);
  LOG_INFO("Transfers: {} succeeded, {} mismatched, {} failed", stats.transfers_succeeded,
           stats.transfers_mismatched, stats.transfers_failed);
  LOG_INFO("Traffic: {} bytes sent, {} bytes received", stats.bytes_sent, stats.bytes_received);
}
}  // namespace

int main(int argc, char* argv[]) {
  // Parse configuration
  server::ServerConfig config;
  std::error_code ec;

  if (!server::parse_args(argc, argv, config, ec)) {
    if (ec == std::errc::operation_canceled) {
      return EXIT_SUCCESS;
    }
    std::cerr << "Failed to parse arguments: " << ec.message() << '\n';
    std::cerr << "Run 'ferry-server --help' for usage." << '\n';
    return EXIT_FAILURE;
  }

  // Validate configuration
  std::string validation_error;
  if (!server::validate_config(config, validation_error)) {
    std::cerr << "Configuration error: " << validation_error << '\n';
    return EXIT_FAILURE;
  }

  // Initialize logging
  logging::configure_logging(config.verbose ? logging::LogLevel::debug : logging::LogLevel::info,
                             true, config.log_file);
  LOG_INFO("ferry server starting...");
  print_configuration(config);

  try {
    crypto::ensure_sodium_ready();
  } catch (const std::exception& e) {
    LOG_CRITICAL("{}", e.what());
    return EXIT_FAILURE;
  }

  server::TransferServer transfer_server(config);
  if (!transfer_server.start(ec)) {
    return EXIT_FAILURE;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  std::thread accept_thread([&transfer_server] { transfer_server.run(); });

  auto last_stats = std::chrono::steady_clock::now();
  while (g_signal.load() == 0 && !transfer_server.stopping()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // Periodic stats display (every 60 seconds in verbose mode)
    auto now = std::chrono::steady_clock::now();
    if (config.verbose && now - last_stats >= std::chrono::seconds(60)) {
      print_statistics(transfer_server.stats());
      last_stats = now;
    }
  }
  if (const int signo = g_signal.load(); signo != 0) {
    LOG_INFO("Received {}, shutting down...", signo == SIGINT ? "SIGINT" : "SIGTERM");
  }

  transfer_server.stop();
  accept_thread.join();

  print_statistics(transfer_server.stats());
  LOG_INFO("ferry server stopped");
  return EXIT_SUCCESS;
}
