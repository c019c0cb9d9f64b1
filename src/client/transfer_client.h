#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "client/client_config.h"
#include "transfer/session/receiver_session.h"

namespace ferry::client {

// Process exit codes.
inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitMismatch = 2;

struct ClientReport {
  session::UploadOutcome outcome;
  std::string output_file;
  // True once the reassembled copy was written to output_file.
  bool saved{false};
  // Uploads made, including the first.
  std::uint32_t attempts{0};
};

// 0 for a saved, verified copy; 2 for a checksum mismatch; 1 otherwise.
int exit_code(const ClientReport& report);

bool read_file(const std::string& path, std::vector<std::uint8_t>& out, std::error_code& ec);
bool write_file(const std::string& path, std::span<const std::uint8_t> data, std::error_code& ec);

// One connection per transfer; the connection is closed when upload returns.
class TransferClient {
 public:
  explicit TransferClient(ClientConfig config);

  // Upload data under file_name and receive it back. Connection failures end
  // in kFailed with the reason in outcome.error.
  session::UploadOutcome upload_buffer(std::span<const std::uint8_t> data,
                                       const std::string& file_name);

  // Read input_file, transfer it and save the copy to output_file. A failed or
  // mismatched transfer is repeated up to max_retries times; a copy that still
  // mismatches after the last attempt is saved and reported as such.
  ClientReport upload_file();

  [[nodiscard]] const ClientConfig& config() const { return config_; }

 private:
  ClientConfig config_;
};

}  // namespace ferry::client
