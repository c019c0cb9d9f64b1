#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "common/crypto/digest.h"
#include "transfer/protocol/messages.h"

namespace ferry::chunking {

// Verified chunk payloads keyed by sequence number. Arrival order does not
// matter; assemble() orders by sequence.
class ReassemblyBuffer {
 public:
  explicit ReassemblyBuffer(std::uint64_t total_chunks);

  // Store a verified payload. Returns false without touching the buffer when
  // the sequence is out of range or already present (first copy wins).
  bool insert(std::uint64_t sequence, std::vector<std::uint8_t> payload);

  [[nodiscard]] bool contains(std::uint64_t sequence) const {
    return chunks_.find(sequence) != chunks_.end();
  }
  [[nodiscard]] std::size_t size() const { return chunks_.size(); }
  [[nodiscard]] std::uint64_t total_chunks() const { return total_chunks_; }
  [[nodiscard]] bool is_complete() const { return chunks_.size() == total_chunks_; }

  // Sequence numbers not yet stored, ascending.
  [[nodiscard]] std::vector<std::uint64_t> missing() const;

  // Total payload bytes held.
  [[nodiscard]] std::size_t memory_usage() const { return bytes_; }

  // Concatenation in ascending sequence order; nullopt while incomplete.
  [[nodiscard]] std::optional<std::vector<std::uint8_t>> assemble() const;

  // SHA-256 over the assembled bytes without materializing them.
  [[nodiscard]] std::optional<crypto::FileDigest> digest() const;

 private:
  std::uint64_t total_chunks_;
  std::size_t bytes_{0};
  std::map<std::uint64_t, std::vector<std::uint8_t>> chunks_;
};

enum class ChunkAction { kAccept, kRequestRetransmit };

struct ChunkDecision {
  ChunkAction action{ChunkAction::kAccept};
  std::uint64_t sequence{0};
  // Accepted, but the sequence was already stored.
  bool duplicate{false};
};

struct ReassemblerStats {
  std::uint64_t chunks_accepted{0};
  std::uint64_t duplicates{0};
  std::uint64_t digest_mismatches{0};
};

// Receiver-side chunk admission: verify, deduplicate, store.
class Reassembler {
 public:
  explicit Reassembler(std::uint64_t total_chunks);

  // Callers validate the sequence range before handing the chunk over;
  // an out-of-range sequence is rejected like a corrupted chunk.
  ChunkDecision on_chunk(protocol::ChunkMessage msg);

  [[nodiscard]] const ReassemblyBuffer& buffer() const { return buffer_; }
  [[nodiscard]] const ReassemblerStats& stats() const { return stats_; }
  [[nodiscard]] bool is_complete() const { return buffer_.is_complete(); }

 private:
  ReassemblyBuffer buffer_;
  ReassemblerStats stats_;
};

}  // namespace ferry::chunking
