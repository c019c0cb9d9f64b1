#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "transfer/session/sender_session.h"
#include "transfer/session/transfer_state.h"
#include "transport/tcp_socket/tcp_socket.h"

namespace ferry::server {

// Diagnostic copy of a finished transfer.
struct SessionRecord {
  std::string session_id;
  transport::Endpoint peer;
  session::TransferState state{session::TransferState::kFailed};
  std::string file_name;
  std::string checksum;
  std::uint64_t file_size{0};
  std::uint64_t chunk_size{0};
  std::uint64_t total_chunks{0};
  session::SenderStats stats;

  // Timestamps.
  std::chrono::steady_clock::time_point created_at;
  std::chrono::steady_clock::time_point finished_at;

  // Failure reason; empty on success.
  std::string error;
};

struct SessionRegistryStats {
  std::size_t records_held{0};
  std::size_t records_written{0};
  std::size_t records_expired{0};
  std::size_t duplicate_writes{0};
};

// Short-lived record of finished sessions keyed by session id. Records are
// written once and removed after the retention window. Not a resume store.
//
// Thread Safety: all methods are thread-safe.
class SessionRegistry {
 public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  explicit SessionRegistry(std::chrono::seconds retention,
                           std::function<TimePoint()> now_fn = Clock::now);

  // Store a record. Returns false if the session id is already present.
  bool record(SessionRecord record);

  std::optional<SessionRecord> find(const std::string& session_id) const;

  // Remove records older than the retention window (measured from
  // finished_at). Returns number of records removed.
  std::size_t cleanup_expired();

  // Copies of all held records, safe to use after they expire.
  std::vector<SessionRecord> snapshot() const;

  SessionRegistryStats stats() const;

  std::size_t size() const;

  [[nodiscard]] std::chrono::seconds retention() const { return retention_; }
  [[nodiscard]] TimePoint now() const { return now_fn_(); }

 private:
  std::chrono::seconds retention_;
  std::function<TimePoint()> now_fn_;

  std::unordered_map<std::string, SessionRecord> records_;
  SessionRegistryStats stats_;

  mutable std::mutex mutex_;
};

// Generates "<host>:<port>_<unix seconds>_<counter>" identifiers. The counter
// keeps ids unique for connections from the same endpoint within one second.
class SessionIdGenerator {
 public:
  std::string next(const transport::Endpoint& peer);

 private:
  std::mutex mutex_;
  std::uint64_t counter_{0};
};

}  // namespace ferry::server
