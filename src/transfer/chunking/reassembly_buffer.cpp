#include "transfer/chunking/reassembly_buffer.h"

#include "common/logging/logger.h"

namespace ferry::chunking {

ReassemblyBuffer::ReassemblyBuffer(std::uint64_t total_chunks) : total_chunks_(total_chunks) {}

bool ReassemblyBuffer::insert(std::uint64_t sequence, std::vector<std::uint8_t> payload) {
  if (sequence >= total_chunks_) {
    return false;
  }
  const std::size_t length = payload.size();
  auto [it, inserted] = chunks_.try_emplace(sequence, std::move(payload));
  if (inserted) {
    bytes_ += length;
  }
  return inserted;
}

std::vector<std::uint64_t> ReassemblyBuffer::missing() const {
  std::vector<std::uint64_t> result;
  result.reserve(static_cast<std::size_t>(total_chunks_ - chunks_.size()));
  auto it = chunks_.begin();
  for (std::uint64_t seq = 0; seq < total_chunks_; ++seq) {
    if (it != chunks_.end() && it->first == seq) {
      ++it;
    } else {
      result.push_back(seq);
    }
  }
  return result;
}

std::optional<std::vector<std::uint8_t>> ReassemblyBuffer::assemble() const {
  if (!is_complete()) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> out;
  out.reserve(bytes_);
  for (const auto& [seq, payload] : chunks_) {
    out.insert(out.end(), payload.begin(), payload.end());
  }
  return out;
}

std::optional<crypto::FileDigest> ReassemblyBuffer::digest() const {
  if (!is_complete()) {
    return std::nullopt;
  }
  crypto::FileDigestBuilder builder;
  for (const auto& [seq, payload] : chunks_) {
    builder.update(payload);
  }
  return builder.finalize();
}

Reassembler::Reassembler(std::uint64_t total_chunks) : buffer_(total_chunks) {}

ChunkDecision Reassembler::on_chunk(protocol::ChunkMessage msg) {
  ChunkDecision decision;
  decision.sequence = msg.sequence;

  if (msg.sequence >= buffer_.total_chunks()) {
    stats_.digest_mismatches++;
    decision.action = ChunkAction::kRequestRetransmit;
    return decision;
  }

  const auto computed = crypto::to_hex(crypto::digest_chunk(msg.data));
  if (!crypto::hex_digest_equal(computed, msg.chunk_checksum)) {
    stats_.digest_mismatches++;
    LOG_DEBUG("Chunk {} failed verification (expected {}, computed {})", msg.sequence,
              msg.chunk_checksum, computed);
    decision.action = ChunkAction::kRequestRetransmit;
    return decision;
  }

  if (!buffer_.insert(msg.sequence, std::move(msg.data))) {
    stats_.duplicates++;
    decision.duplicate = true;
    return decision;
  }
  stats_.chunks_accepted++;
  return decision;
}

}  // namespace ferry::chunking
