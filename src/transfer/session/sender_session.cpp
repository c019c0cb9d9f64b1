#include "transfer/session/sender_session.h"

#include <limits>
#include <utility>

#include "common/crypto/digest.h"
#include "common/logging/logger.h"

namespace ferry::session {

std::size_t effective_retry_budget(std::size_t configured, std::uint64_t total_chunks) {
  if (configured != 0) {
    return configured;
  }
  const std::uint64_t doubled = total_chunks * 2;
  if (doubled > std::numeric_limits<std::size_t>::max()) {
    return std::numeric_limits<std::size_t>::max();
  }
  return static_cast<std::size_t>(doubled);
}

SenderSession::SenderSession(transport::FrameChannel& channel, std::string session_id,
                             SenderConfig config)
    : channel_(channel),
      config_(std::move(config)),
      injector_(config_.fault),
      machine_(session_id) {
  outcome_.session_id = std::move(session_id);
}

SendOutcome SenderSession::serve() {
  std::error_code ec;
  if (receive_request(ec) && send_metadata(ec) && stream_chunks(ec)) {
    finish(ec);
  }
  return outcome_;
}

bool SenderSession::receive_request(std::error_code& ec) {
  auto text = channel_.read_text(ec);
  if (!text) {
    fail("connection lost before upload request: " + ec.message(), false);
    return false;
  }

  std::string unknown_command;
  auto request = protocol::parse_upload_request(*text, &unknown_command);
  if (!request) {
    reject_request(unknown_command.empty() ? "Malformed upload request"
                                           : "Unknown command: " + unknown_command);
    return false;
  }

  const std::size_t chunk_size = request->chunk_size.value_or(config_.chunk_size);
  if (chunk_size < kMinChunkSize || chunk_size > kMaxChunkSize) {
    reject_request("Chunk size " + std::to_string(chunk_size) + " outside [" +
                   std::to_string(kMinChunkSize) + ", " + std::to_string(kMaxChunkSize) + "]");
    return false;
  }

  file_data_ = std::move(request->file_data);
  chunks_ = chunking::split(file_data_, chunk_size);
  acknowledged_.assign(chunks_.size(), false);
  retry_budget_ =
      effective_retry_budget(request->retry_budget.value_or(config_.retry_budget), chunks_.size());

  outcome_.file_name = request->file_name;
  outcome_.file_size = file_data_.size();
  outcome_.chunk_size = chunk_size;
  outcome_.total_chunks = chunks_.size();
  outcome_.retry_budget = retry_budget_;
  outcome_.checksum = crypto::to_hex(crypto::digest_whole(file_data_));

  LOG_INFO("[{}] Upload '{}': {} bytes, {} chunks of {} bytes, checksum {}", outcome_.session_id,
           outcome_.file_name, outcome_.file_size, outcome_.total_chunks, chunk_size,
           outcome_.checksum);
  return machine_.advance(TransferState::kSendingMetadata);
}

bool SenderSession::send_metadata(std::error_code& ec) {
  protocol::TransferMetadata metadata;
  metadata.session_id = outcome_.session_id;
  metadata.checksum = outcome_.checksum;
  metadata.total_chunks = outcome_.total_chunks;
  metadata.chunk_size = outcome_.chunk_size;
  metadata.file_size = outcome_.file_size;

  if (!channel_.write_text(protocol::encode(metadata), ec)) {
    fail("failed to send metadata: " + ec.message(), false);
    return false;
  }

  auto ready = channel_.read_text(ec);
  if (!ready) {
    fail("connection lost awaiting readiness: " + ec.message(), false);
    return false;
  }
  if (*ready != protocol::kReadyToken) {
    fail("receiver not ready: '" + *ready + "'", true);
    return false;
  }
  return machine_.advance(TransferState::kStreamingChunks);
}

bool SenderSession::stream_chunks(std::error_code& ec) {
  for (const auto& chunk : chunks_) {
    auto fault = injector_.perturb(chunk);
    switch (fault.action) {
      case chunking::FaultAction::kDrop:
        outcome_.stats.chunks_dropped++;
        LOG_DEBUG("[{}] Simulating dropped chunk {}", outcome_.session_id, chunk.sequence);
        continue;
      case chunking::FaultAction::kCorrupt:
        outcome_.stats.chunks_corrupted++;
        LOG_DEBUG("[{}] Simulating corrupted chunk {}", outcome_.session_id, chunk.sequence);
        if (!transmit(*fault.corrupted, ec)) {
          return false;
        }
        break;
      case chunking::FaultAction::kPass:
        if (!transmit(chunk, ec)) {
          return false;
        }
        break;
    }
    if (!await_reply(chunk.sequence, ec)) {
      return false;
    }
  }

  // Dropped chunks produced no reply; resend until the receiver holds all of them.
  while (auto missing = first_unacknowledged()) {
    if (!retransmit(*missing, ec) || !await_reply(*missing, ec)) {
      return false;
    }
  }
  return machine_.advance(TransferState::kAwaitingCompletion);
}

void SenderSession::finish(std::error_code& ec) {
  if (!channel_.write_text(protocol::encode(protocol::EndMessage{"File transmission complete"}),
                           ec)) {
    fail("failed to send end marker: " + ec.message(), false);
    return;
  }
  if (!machine_.advance(TransferState::kVerifying)) {
    fail("unable to enter verification", false);
    return;
  }

  auto text = channel_.read_text(ec);
  if (!text) {
    fail("connection lost awaiting verdict: " + ec.message(), false);
    return;
  }

  auto verdict = protocol::parse_verdict(*text);
  if (!verdict) {
    fail("unrecognized verdict '" + *text + "'", false);
    return;
  }

  switch (*verdict) {
    case protocol::Verdict::kSuccess:
      machine_.advance(TransferState::kSuccess);
      break;
    case protocol::Verdict::kChecksumMismatch:
      outcome_.error = "receiver reported checksum mismatch";
      machine_.advance(TransferState::kMismatch);
      break;
    case protocol::Verdict::kError:
      fail("receiver reported an error", false);
      return;
  }
  outcome_.state = machine_.state();
  LOG_INFO("[{}] Transfer result: {} ({} sent, {} dropped, {} corrupted, {} retransmitted)",
           outcome_.session_id, to_string(outcome_.state), outcome_.stats.chunks_transmitted,
           outcome_.stats.chunks_dropped, outcome_.stats.chunks_corrupted,
           outcome_.stats.retransmissions);
}

bool SenderSession::transmit(const chunking::Chunk& chunk, std::error_code& ec) {
  protocol::ChunkMessage msg;
  msg.session_id = outcome_.session_id;
  msg.sequence = chunk.sequence;
  msg.data = chunk.payload;
  msg.chunk_checksum = crypto::to_hex(chunk.digest);

  if (!channel_.write_text(protocol::encode(msg), ec)) {
    fail("failed to send chunk " + std::to_string(chunk.sequence) + ": " + ec.message(), false);
    return false;
  }
  outcome_.stats.chunks_transmitted++;
  return true;
}

bool SenderSession::retransmit(std::uint64_t sequence, std::error_code& ec) {
  if (outcome_.stats.retransmissions >= retry_budget_) {
    fail("retry budget of " + std::to_string(retry_budget_) + " exhausted", true);
    return false;
  }
  outcome_.stats.retransmissions++;
  LOG_DEBUG("[{}] Retransmitting chunk {} ({}/{})", outcome_.session_id, sequence,
            outcome_.stats.retransmissions, retry_budget_);
  return transmit(chunks_[static_cast<std::size_t>(sequence)], ec);
}

bool SenderSession::await_reply(std::uint64_t sequence, std::error_code& ec) {
  std::uint64_t in_flight = sequence;
  while (true) {
    auto text = channel_.read_text(ec);
    if (!text) {
      fail("connection lost awaiting reply for chunk " + std::to_string(in_flight) + ": " +
               ec.message(),
           false);
      return false;
    }

    auto reply = protocol::parse_chunk_reply(*text);
    if (!reply) {
      fail("unexpected reply '" + *text + "'", true);
      return false;
    }

    switch (reply->kind) {
      case protocol::ReplyKind::kOk:
        if (!acknowledged_[static_cast<std::size_t>(in_flight)]) {
          acknowledged_[static_cast<std::size_t>(in_flight)] = true;
          outcome_.stats.chunks_acknowledged++;
        }
        return true;
      case protocol::ReplyKind::kError:
        fail("receiver reported an error for chunk " + std::to_string(in_flight), false);
        return false;
      case protocol::ReplyKind::kRetransmit: {
        const std::uint64_t target = reply->sequence.value_or(in_flight);
        if (target >= chunks_.size()) {
          fail("retransmission requested for unknown chunk " + std::to_string(target), true);
          return false;
        }
        LOG_DEBUG("[{}] Receiver requested chunk {}", outcome_.session_id, target);
        if (!retransmit(target, ec)) {
          return false;
        }
        in_flight = target;
        break;
      }
    }
  }
}

std::optional<std::uint64_t> SenderSession::first_unacknowledged() const {
  for (std::size_t i = 0; i < acknowledged_.size(); ++i) {
    if (!acknowledged_[i]) {
      return static_cast<std::uint64_t>(i);
    }
  }
  return std::nullopt;
}

void SenderSession::fail(std::string reason, bool notify_peer) {
  LOG_WARN("[{}] Transfer failed in {}: {}", outcome_.session_id, to_string(machine_.state()),
           reason);
  if (notify_peer) {
    std::error_code ec;
    if (!channel_.write_text(protocol::encode(protocol::AbortMessage{reason}), ec)) {
      LOG_DEBUG("[{}] Could not notify receiver: {}", outcome_.session_id, ec.message());
    }
  }
  machine_.advance(TransferState::kFailed);
  outcome_.state = machine_.state();
  outcome_.error = std::move(reason);
}

void SenderSession::reject_request(const std::string& reason) {
  LOG_WARN("[{}] Rejecting upload: {}", outcome_.session_id, reason);
  std::error_code ec;
  if (!channel_.write_text(protocol::encode(protocol::ErrorResponse{reason}), ec)) {
    LOG_DEBUG("[{}] Could not send error response: {}", outcome_.session_id, ec.message());
  }
  machine_.advance(TransferState::kFailed);
  outcome_.state = machine_.state();
  outcome_.error = reason;
}

}  // namespace ferry::session
