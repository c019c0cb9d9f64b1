#include "client/transfer_client.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>

#include "common/logging/logger.h"
#include "transport/framing/frame_channel.h"
#include "transport/tcp_socket/tcp_socket.h"

namespace ferry::client {

int exit_code(const ClientReport& report) {
  switch (report.outcome.state) {
    case session::TransferState::kSuccess:
      return report.saved ? kExitSuccess : kExitFailure;
    case session::TransferState::kMismatch:
      return kExitMismatch;
    default:
      return kExitFailure;
  }
}

bool read_file(const std::string& path, std::vector<std::uint8_t>& out, std::error_code& ec) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    ec = std::error_code(errno, std::generic_category());
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad()) {
    ec = std::make_error_code(std::errc::io_error);
    return false;
  }
  return true;
}

bool write_file(const std::string& path, std::span<const std::uint8_t> data, std::error_code& ec) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    ec = std::error_code(errno, std::generic_category());
    return false;
  }
  file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  file.flush();
  if (!file) {
    ec = std::make_error_code(std::errc::io_error);
    return false;
  }
  return true;
}

TransferClient::TransferClient(ClientConfig config) : config_(std::move(config)) {}

session::UploadOutcome TransferClient::upload_buffer(std::span<const std::uint8_t> data,
                                                     const std::string& file_name) {
  transport::Endpoint server{config_.server_address, config_.server_port};
  transport::TcpStream stream;
  std::error_code ec;

  if (!stream.connect(server, ec)) {
    session::UploadOutcome outcome;
    outcome.error = "failed to connect to " + transport::to_string(server) + ": " + ec.message();
    LOG_ERROR("{}", outcome.error);
    return outcome;
  }
  LOG_INFO("Connected to {}", transport::to_string(server));

  if (!stream.set_read_timeout(config_.read_timeout, ec)) {
    LOG_WARN("Failed to set read timeout: {}", ec.message());
  }

  transport::FrameChannel channel(stream);
  session::ReceiverConfig receiver_config;
  receiver_config.chunk_size = config_.chunk_size;
  receiver_config.retry_budget = config_.retry_budget;

  session::ReceiverSession session(channel, receiver_config);
  auto outcome = session.upload(data, file_name);
  stream.close();

  const auto& io = channel.stats();
  LOG_DEBUG("Connection closed: {} frames / {} bytes sent, {} frames / {} bytes received",
            io.frames_sent, io.bytes_sent, io.frames_received, io.bytes_received);
  return outcome;
}

ClientReport TransferClient::upload_file() {
  ClientReport report;
  report.output_file = config_.output_file.empty() ? default_output_path(config_.input_file)
                                                   : config_.output_file;

  std::vector<std::uint8_t> data;
  std::error_code ec;
  if (!read_file(config_.input_file, data, ec)) {
    report.outcome.error = "cannot read " + config_.input_file + ": " + ec.message();
    LOG_ERROR("{}", report.outcome.error);
    return report;
  }

  const auto file_name = std::filesystem::path(config_.input_file).filename().string();
  const std::uint32_t max_attempts = config_.max_retries + 1;
  while (report.attempts < max_attempts) {
    report.attempts++;
    if (report.attempts > 1) {
      LOG_INFO("Retrying upload (attempt {}/{})...", report.attempts, max_attempts);
    }
    report.outcome = upload_buffer(data, file_name);
    if (report.outcome.state == session::TransferState::kSuccess) {
      break;
    }
    LOG_WARN("Attempt {}/{} ended {}: {}", report.attempts, max_attempts,
             session::to_string(report.outcome.state), report.outcome.error);
  }
  if (report.outcome.state != session::TransferState::kSuccess && max_attempts > 1) {
    LOG_ERROR("Maximum retry count reached, giving up");
  }

  const auto state = report.outcome.state;
  if (state != session::TransferState::kSuccess && state != session::TransferState::kMismatch) {
    LOG_ERROR("Transfer failed: {}", report.outcome.error);
    return report;
  }

  if (!write_file(report.output_file, report.outcome.data, ec)) {
    LOG_ERROR("Failed to save {}: {}", report.output_file, ec.message());
    return report;
  }
  report.saved = true;

  if (state == session::TransferState::kSuccess) {
    LOG_INFO("Saved verified copy to {} ({} bytes)", report.output_file,
             report.outcome.data.size());
  } else {
    LOG_WARN("Saved {} but its checksum does not match; the copy is inconsistent",
             report.output_file);
  }
  return report;
}

}  // namespace ferry::client
