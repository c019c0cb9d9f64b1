#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "transfer/chunking/fault_injector.h"
#include "transfer/chunking/splitter.h"
#include "transfer/protocol/messages.h"
#include "transfer/session/transfer_state.h"
#include "transport/framing/frame_channel.h"

namespace ferry::session {

// Bounds for a chunk size requested by either side.
inline constexpr std::size_t kMinChunkSize = 1;
inline constexpr std::size_t kMaxChunkSize = 1 << 20;

struct SenderConfig {
  std::size_t chunk_size{1024};
  // Resends allowed per transfer; 0 selects twice the chunk count.
  std::size_t retry_budget{0};
  chunking::FaultPolicy fault;
};

struct SenderStats {
  std::uint64_t chunks_transmitted{0};
  std::uint64_t chunks_dropped{0};
  std::uint64_t chunks_corrupted{0};
  std::uint64_t retransmissions{0};
  std::uint64_t chunks_acknowledged{0};
};

struct SendOutcome {
  TransferState state{TransferState::kFailed};
  std::string session_id;
  std::string file_name;
  std::string checksum;
  std::uint64_t file_size{0};
  std::uint64_t chunk_size{0};
  std::uint64_t total_chunks{0};
  std::size_t retry_budget{0};
  SenderStats stats;
  // Empty unless the session failed or mismatched.
  std::string error;
};

std::size_t effective_retry_budget(std::size_t configured, std::uint64_t total_chunks);

// Server side of one transfer: receives the upload, splits it and streams
// the chunks back until the receiver reports its verdict.
//
// Thread Safety: not thread-safe; owned by the connection's thread.
class SenderSession {
 public:
  // Throws std::invalid_argument if the fault policy is invalid.
  SenderSession(transport::FrameChannel& channel, std::string session_id, SenderConfig config);

  // Drive the session from INIT to a terminal state. Peer and I/O failures end
  // in kFailed; nothing is thrown for them.
  SendOutcome serve();

  [[nodiscard]] TransferState state() const { return machine_.state(); }

 private:
  bool receive_request(std::error_code& ec);
  bool send_metadata(std::error_code& ec);
  bool stream_chunks(std::error_code& ec);
  void finish(std::error_code& ec);

  bool transmit(const chunking::Chunk& chunk, std::error_code& ec);
  bool retransmit(std::uint64_t sequence, std::error_code& ec);
  bool await_reply(std::uint64_t sequence, std::error_code& ec);
  std::optional<std::uint64_t> first_unacknowledged() const;

  void fail(std::string reason, bool notify_peer);
  void reject_request(const std::string& reason);

  transport::FrameChannel& channel_;
  SenderConfig config_;
  chunking::FaultInjector injector_;
  StateMachine machine_;
  SendOutcome outcome_;

  std::vector<std::uint8_t> file_data_;
  std::vector<chunking::Chunk> chunks_;
  std::vector<bool> acknowledged_;
  std::size_t retry_budget_{0};
};

}  // namespace ferry::session
