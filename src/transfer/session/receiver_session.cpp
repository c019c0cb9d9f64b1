#include "transfer/session/receiver_session.h"

#include <utility>
#include <variant>

#include "common/crypto/digest.h"
#include "common/logging/logger.h"
#include "transfer/chunking/splitter.h"

namespace ferry::session {

ReceiverSession::ReceiverSession(transport::FrameChannel& channel, ReceiverConfig config)
    : channel_(channel), config_(std::move(config)), machine_("receiver") {}

UploadOutcome ReceiverSession::upload(std::span<const std::uint8_t> data,
                                      const std::string& file_name) {
  std::error_code ec;
  if (send_request(data, file_name, ec) && receive_metadata(data, ec) && receive_chunks(ec) &&
      await_end(ec)) {
    verify(ec);
  }
  sync_stats();
  return outcome_;
}

bool ReceiverSession::send_request(std::span<const std::uint8_t> data,
                                   const std::string& file_name, std::error_code& ec) {
  protocol::UploadRequest request;
  request.file_name = file_name;
  request.file_data.assign(data.begin(), data.end());
  request.chunk_size = config_.chunk_size;
  request.retry_budget = config_.retry_budget;

  if (!channel_.write_text(protocol::encode(request), ec)) {
    fail("failed to send upload request: " + ec.message(), false);
    return false;
  }
  LOG_INFO("Uploaded '{}' ({} bytes), waiting for metadata", file_name, data.size());
  return machine_.advance(TransferState::kSendingMetadata);
}

bool ReceiverSession::receive_metadata(std::span<const std::uint8_t> data, std::error_code& ec) {
  auto text = channel_.read_text(ec);
  if (!text) {
    fail("connection lost awaiting metadata: " + ec.message(), false);
    return false;
  }

  auto response = protocol::parse_metadata_response(*text);
  if (!response) {
    fail("malformed metadata response", true);
    return false;
  }
  if (const auto* error = std::get_if<protocol::ErrorResponse>(&*response)) {
    fail("server rejected upload: " + error->message, false);
    return false;
  }

  auto& metadata = std::get<protocol::TransferMetadata>(*response);
  outcome_.session_id = metadata.session_id;
  outcome_.declared_checksum = metadata.checksum;
  outcome_.total_chunks = metadata.total_chunks;
  outcome_.file_size = metadata.file_size;
  machine_.set_label(metadata.session_id);

  if (metadata.chunk_size == 0 ||
      metadata.total_chunks != chunking::chunk_count(metadata.file_size, metadata.chunk_size)) {
    fail("inconsistent metadata: " + std::to_string(metadata.total_chunks) + " chunks of " +
             std::to_string(metadata.chunk_size) + " bytes for " +
             std::to_string(metadata.file_size) + " bytes",
         true);
    return false;
  }
  // The server echoes the upload, so the size must match; this also bounds
  // total_chunks by the bytes actually sent.
  if (metadata.file_size != data.size()) {
    fail("server reports " + std::to_string(metadata.file_size) + " bytes, uploaded " +
             std::to_string(data.size()),
         true);
    return false;
  }
  if (!crypto::hex_digest_equal(metadata.checksum, crypto::to_hex(crypto::digest_whole(data)))) {
    LOG_WARN("[{}] Server checksum differs from the uploaded file", outcome_.session_id);
  }

  LOG_INFO("[{}] Expecting {} chunks of {} bytes, checksum {}", outcome_.session_id,
           metadata.total_chunks, metadata.chunk_size, metadata.checksum);
  reassembler_.emplace(metadata.total_chunks);

  if (!channel_.write_text(protocol::kReadyToken, ec)) {
    fail("failed to signal readiness: " + ec.message(), false);
    return false;
  }
  return machine_.advance(TransferState::kStreamingChunks);
}

bool ReceiverSession::receive_chunks(std::error_code& ec) {
  while (!reassembler_->is_complete()) {
    std::optional<protocol::StreamMessage> message;
    if (!next_message(message, ec)) {
      return false;
    }
    if (!message) {
      outcome_.stats.retransmit_requests++;
      if (!reply(protocol::make_retransmit_last_reply(), ec)) {
        return false;
      }
      continue;
    }
    if (auto* chunk = std::get_if<protocol::ChunkMessage>(&*message)) {
      if (!handle_chunk(std::move(*chunk), ec)) {
        return false;
      }
      continue;
    }
    if (const auto* abort = std::get_if<protocol::AbortMessage>(&*message)) {
      fail("sender aborted: " + abort->message, false);
      return false;
    }
    const auto& buffer = reassembler_->buffer();
    fail("end marker received with " + std::to_string(buffer.total_chunks() - buffer.size()) +
             " chunks missing",
         true);
    return false;
  }
  LOG_DEBUG("[{}] All {} chunks received", outcome_.session_id, outcome_.total_chunks);
  return machine_.advance(TransferState::kAwaitingCompletion);
}

bool ReceiverSession::await_end(std::error_code& ec) {
  while (true) {
    std::optional<protocol::StreamMessage> message;
    if (!next_message(message, ec)) {
      return false;
    }
    if (!message) {
      fail("malformed frame after the last chunk", true);
      return false;
    }
    if (auto* chunk = std::get_if<protocol::ChunkMessage>(&*message)) {
      // Every chunk is already stored; acknowledge the late copy.
      reassembler_->on_chunk(std::move(*chunk));
      if (!reply(protocol::make_ok_reply(), ec)) {
        return false;
      }
      continue;
    }
    if (const auto* abort = std::get_if<protocol::AbortMessage>(&*message)) {
      fail("sender aborted: " + abort->message, false);
      return false;
    }
    LOG_DEBUG("[{}] End marker: {}", outcome_.session_id,
              std::get<protocol::EndMessage>(*message).message);
    return machine_.advance(TransferState::kVerifying);
  }
}

void ReceiverSession::verify(std::error_code& ec) {
  auto digest = reassembler_->buffer().digest();
  auto data = reassembler_->buffer().assemble();
  if (!digest || !data) {
    fail("reassembly incomplete at verification", true);
    return;
  }

  outcome_.computed_checksum = crypto::to_hex(*digest);
  const bool match = crypto::hex_digest_equal(outcome_.computed_checksum,
                                              outcome_.declared_checksum);
  const auto verdict = match ? protocol::Verdict::kSuccess : protocol::Verdict::kChecksumMismatch;

  if (!channel_.write_text(protocol::to_token(verdict), ec)) {
    fail("failed to send verdict: " + ec.message(), false);
    return;
  }

  outcome_.data = std::move(*data);
  if (match) {
    LOG_INFO("[{}] Checksum verified ({} bytes)", outcome_.session_id, outcome_.data.size());
    machine_.advance(TransferState::kSuccess);
  } else {
    outcome_.error = "checksum mismatch: expected " + outcome_.declared_checksum + ", computed " +
                     outcome_.computed_checksum;
    LOG_ERROR("[{}] {}", outcome_.session_id, outcome_.error);
    machine_.advance(TransferState::kMismatch);
  }
  outcome_.state = machine_.state();
}

bool ReceiverSession::next_message(std::optional<protocol::StreamMessage>& out,
                                   std::error_code& ec) {
  auto text = channel_.read_text(ec);
  if (!text) {
    fail("connection lost in " + std::string(to_string(machine_.state())) + ": " + ec.message(),
         false);
    return false;
  }
  outcome_.stats.frames_received++;

  auto message = protocol::parse_stream_message(*text);
  if (!message) {
    outcome_.stats.malformed_frames++;
    LOG_DEBUG("[{}] Malformed stream frame ({} bytes)", outcome_.session_id, text->size());
    return true;
  }
  if (const auto* chunk = std::get_if<protocol::ChunkMessage>(&*message)) {
    if (chunk->session_id != outcome_.session_id) {
      outcome_.stats.malformed_frames++;
      LOG_DEBUG("[{}] Chunk for foreign session '{}'", outcome_.session_id, chunk->session_id);
      return true;
    }
    if (chunk->sequence >= outcome_.total_chunks) {
      outcome_.stats.malformed_frames++;
      LOG_DEBUG("[{}] Chunk sequence {} out of range", outcome_.session_id, chunk->sequence);
      return true;
    }
  }
  out = std::move(message);
  return true;
}

bool ReceiverSession::reply(const protocol::ChunkReply& reply, std::error_code& ec) {
  if (!channel_.write_text(protocol::format_chunk_reply(reply), ec)) {
    fail("failed to send reply: " + ec.message(), false);
    return false;
  }
  return true;
}

bool ReceiverSession::handle_chunk(protocol::ChunkMessage chunk, std::error_code& ec) {
  const auto decision = reassembler_->on_chunk(std::move(chunk));
  if (decision.action == chunking::ChunkAction::kRequestRetransmit) {
    outcome_.stats.retransmit_requests++;
    LOG_DEBUG("[{}] Requesting retransmission of chunk {}", outcome_.session_id,
              decision.sequence);
    return reply(protocol::make_retransmit_reply(decision.sequence), ec);
  }
  if (decision.duplicate) {
    LOG_DEBUG("[{}] Duplicate chunk {}", outcome_.session_id, decision.sequence);
  }
  return reply(protocol::make_ok_reply(), ec);
}

void ReceiverSession::sync_stats() {
  if (!reassembler_) {
    return;
  }
  const auto& stats = reassembler_->stats();
  outcome_.stats.chunks_accepted = stats.chunks_accepted;
  outcome_.stats.duplicates = stats.duplicates;
  outcome_.stats.digest_mismatches = stats.digest_mismatches;
}

void ReceiverSession::fail(std::string reason, bool notify_peer) {
  LOG_WARN("[{}] Transfer failed in {}: {}", outcome_.session_id, to_string(machine_.state()),
           reason);
  if (notify_peer) {
    std::error_code ec;
    if (!channel_.write_text(protocol::kErrorToken, ec)) {
      LOG_DEBUG("[{}] Could not notify sender: {}", outcome_.session_id, ec.message());
    }
  }
  machine_.advance(TransferState::kFailed);
  outcome_.state = machine_.state();
  outcome_.error = std::move(reason);
}

}  // namespace ferry::session
