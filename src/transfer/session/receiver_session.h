#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "transfer/chunking/reassembly_buffer.h"
#include "transfer/protocol/messages.h"
#include "transfer/session/transfer_state.h"
#include "transport/framing/frame_channel.h"

namespace ferry::session {

struct ReceiverConfig {
  // Overrides sent with the upload request; the server defaults apply otherwise.
  std::optional<std::size_t> chunk_size;
  std::optional<std::size_t> retry_budget;
};

struct ReceiverStats {
  std::uint64_t frames_received{0};
  std::uint64_t chunks_accepted{0};
  std::uint64_t duplicates{0};
  std::uint64_t digest_mismatches{0};
  std::uint64_t malformed_frames{0};
  std::uint64_t retransmit_requests{0};
};

struct UploadOutcome {
  TransferState state{TransferState::kFailed};
  std::string session_id;
  std::string declared_checksum;
  std::string computed_checksum;
  std::uint64_t total_chunks{0};
  std::uint64_t file_size{0};
  // Reassembled bytes; filled for kSuccess and kMismatch.
  std::vector<std::uint8_t> data;
  ReceiverStats stats;
  std::string error;
};

// Client side of one transfer: uploads a buffer, then reassembles and
// verifies the chunks the server streams back.
//
// Thread Safety: not thread-safe.
class ReceiverSession {
 public:
  ReceiverSession(transport::FrameChannel& channel, ReceiverConfig config = {});

  // Runs one complete transfer. Peer and I/O failures end in kFailed.
  UploadOutcome upload(std::span<const std::uint8_t> data, const std::string& file_name);

  [[nodiscard]] TransferState state() const { return machine_.state(); }

 private:
  bool send_request(std::span<const std::uint8_t> data, const std::string& file_name,
                    std::error_code& ec);
  bool receive_metadata(std::span<const std::uint8_t> data, std::error_code& ec);
  bool receive_chunks(std::error_code& ec);
  bool await_end(std::error_code& ec);
  void verify(std::error_code& ec);
  void sync_stats();

  // Read one stream frame and validate it against the session. Returns false
  // when the connection is gone; out stays empty for a malformed frame.
  bool next_message(std::optional<protocol::StreamMessage>& out, std::error_code& ec);
  bool reply(const protocol::ChunkReply& reply, std::error_code& ec);
  bool handle_chunk(protocol::ChunkMessage chunk, std::error_code& ec);

  void fail(std::string reason, bool notify_peer);

  transport::FrameChannel& channel_;
  ReceiverConfig config_;
  StateMachine machine_;
  UploadOutcome outcome_;
  std::optional<chunking::Reassembler> reassembler_;
};

}  // namespace ferry::session
