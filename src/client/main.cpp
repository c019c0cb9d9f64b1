#include <cstdlib>
#include <exception>
#include <iostream>

#include "client/client_config.h"
#include "client/transfer_client.h"
#include "common/crypto/digest.h"
#include "common/logging/logger.h"

using namespace ferry;

namespace {
void print_summary(const client::ClientReport& report) {
  const auto& outcome = report.outcome;
  const auto& stats = outcome.stats;
  std::cout << "Session:      " << (outcome.session_id.empty() ? "-" : outcome.session_id) << '\n';
  std::cout << "Result:       " << session::to_string(outcome.state) << '\n';
  std::cout << "Attempts:     " << report.attempts << '\n';
  std::cout << "Chunks:       " << stats.chunks_accepted << "/" << outcome.total_chunks
            << " accepted, " << stats.duplicates << " duplicates, " << stats.digest_mismatches
            << " corrupted, " << stats.malformed_frames << " malformed" << '\n';
  std::cout << "Retransmits:  " << stats.retransmit_requests << " requested" << '\n';
  if (!outcome.declared_checksum.empty()) {
    std::cout << "Checksum:     " << outcome.declared_checksum << '\n';
  }
  if (report.saved) {
    std::cout << "Saved to:     " << report.output_file << '\n';
  }
  if (!outcome.error.empty()) {
    std::cout << "Error:        " << outcome.error << '\n';
  }
}
}  // namespace

int main(int argc, char* argv[]) {
  client::ClientConfig config;
  std::error_code ec;

  if (!client::parse_args(argc, argv, config, ec)) {
    if (ec == std::errc::operation_canceled) {
      return client::kExitSuccess;
    }
    std::cerr << "Failed to parse arguments: " << ec.message() << '\n';
    std::cerr << "Usage: ferry-client [-s <host>] [-p <port>] [-o <output>] <file>" << '\n';
    return client::kExitFailure;
  }

  std::string validation_error;
  if (!client::validate_config(config, validation_error)) {
    std::cerr << "Configuration error: " << validation_error << '\n';
    return client::kExitFailure;
  }

  logging::configure_logging(config.verbose ? logging::LogLevel::debug : logging::LogLevel::info,
                             true, config.log_file);

  try {
    crypto::ensure_sodium_ready();
  } catch (const std::exception& e) {
    LOG_CRITICAL("{}", e.what());
    return client::kExitFailure;
  }

  client::TransferClient transfer_client(config);
  const auto report = transfer_client.upload_file();
  print_summary(report);
  return client::exit_code(report);
}
