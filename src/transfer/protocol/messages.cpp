#include "transfer/protocol/messages.h"

#include <charconv>

#include <nlohmann/json.hpp>

#include "common/crypto/digest.h"

using json = nlohmann::json;

namespace ferry::protocol {

namespace {

std::optional<json> parse_object(std::string_view text) {
  json j = json::parse(text.begin(), text.end(), nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }
  return j;
}

bool get_string(const json& j, const char* key, std::string& out) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

std::string string_or(const json& j, const char* key, std::string fallback) {
  std::string value;
  return get_string(j, key, value) ? value : fallback;
}

bool get_u64(const json& j, const char* key, std::uint64_t& out) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number_integer()) {
    return false;
  }
  if (it->is_number_unsigned()) {
    out = it->get<std::uint64_t>();
    return true;
  }
  const auto value = it->get<std::int64_t>();
  if (value < 0) {
    return false;
  }
  out = static_cast<std::uint64_t>(value);
  return true;
}

bool get_hex(const json& j, const char* key, std::vector<std::uint8_t>& out) {
  std::string hex;
  if (!get_string(j, key, hex)) {
    return false;
  }
  auto bytes = crypto::from_hex(hex);
  if (!bytes) {
    return false;
  }
  out = std::move(*bytes);
  return true;
}

// Optional unsigned field: absent is fine, present-but-invalid is not.
bool get_optional_size(const json& j, const char* key, std::optional<std::size_t>& out) {
  if (!j.contains(key)) {
    return true;
  }
  std::uint64_t value = 0;
  if (!get_u64(j, key, value)) {
    return false;
  }
  out = static_cast<std::size_t>(value);
  return true;
}

}  // namespace

std::string encode(const UploadRequest& request) {
  json j{{"command", "upload"},
         {"file_name", request.file_name},
         {"file_size", request.file_data.size()},
         {"file_data", crypto::to_hex(request.file_data)}};
  if (request.chunk_size) {
    j["chunk_size"] = *request.chunk_size;
  }
  if (request.retry_budget) {
    j["retry_budget"] = *request.retry_budget;
  }
  return j.dump();
}

std::string encode(const TransferMetadata& metadata) {
  json j{{"status", "ready"},
         {"session_id", metadata.session_id},
         {"checksum", metadata.checksum},
         {"total_chunks", metadata.total_chunks},
         {"chunk_size", metadata.chunk_size},
         {"file_size", metadata.file_size}};
  return j.dump();
}

std::string encode(const ErrorResponse& response) {
  json j{{"status", "error"}, {"message", response.message}};
  return j.dump();
}

std::string encode(const ChunkMessage& chunk) {
  json j{{"type", "chunk"},
         {"session_id", chunk.session_id},
         {"sequence", chunk.sequence},
         {"data", crypto::to_hex(chunk.data)},
         {"chunk_checksum", chunk.chunk_checksum}};
  return j.dump();
}

std::string encode(const EndMessage& end) {
  json j{{"type", "end"}, {"message", end.message}};
  return j.dump();
}

std::string encode(const AbortMessage& abort) {
  json j{{"type", "error"}, {"message", abort.message}};
  return j.dump();
}

std::optional<UploadRequest> parse_upload_request(std::string_view text,
                                                  std::string* unknown_command) {
  auto j = parse_object(text);
  if (!j) {
    return std::nullopt;
  }

  std::string command;
  if (!get_string(*j, "command", command)) {
    return std::nullopt;
  }
  if (command != "upload") {
    if (unknown_command != nullptr) {
      *unknown_command = command;
    }
    return std::nullopt;
  }

  UploadRequest request;
  if (!get_string(*j, "file_name", request.file_name) ||
      !get_hex(*j, "file_data", request.file_data)) {
    return std::nullopt;
  }
  // file_size is informational but must agree with the payload when present.
  if (j->contains("file_size")) {
    std::uint64_t declared = 0;
    if (!get_u64(*j, "file_size", declared) || declared != request.file_data.size()) {
      return std::nullopt;
    }
  }
  if (!get_optional_size(*j, "chunk_size", request.chunk_size) ||
      !get_optional_size(*j, "retry_budget", request.retry_budget)) {
    return std::nullopt;
  }
  return request;
}

std::optional<MetadataResponse> parse_metadata_response(std::string_view text) {
  auto j = parse_object(text);
  if (!j) {
    return std::nullopt;
  }

  std::string status;
  if (!get_string(*j, "status", status)) {
    return std::nullopt;
  }

  if (status == "error") {
    return MetadataResponse{ErrorResponse{string_or(*j, "message", "unspecified error")}};
  }

  if (status != "ready") {
    return std::nullopt;
  }

  TransferMetadata metadata;
  if (!get_string(*j, "session_id", metadata.session_id) ||
      !get_string(*j, "checksum", metadata.checksum) ||
      !get_u64(*j, "total_chunks", metadata.total_chunks) ||
      !get_u64(*j, "chunk_size", metadata.chunk_size) ||
      !get_u64(*j, "file_size", metadata.file_size)) {
    return std::nullopt;
  }
  return MetadataResponse{std::move(metadata)};
}

std::optional<StreamMessage> parse_stream_message(std::string_view text) {
  auto j = parse_object(text);
  if (!j) {
    return std::nullopt;
  }

  std::string type;
  if (!get_string(*j, "type", type)) {
    return std::nullopt;
  }

  if (type == "chunk") {
    ChunkMessage chunk;
    if (!get_string(*j, "session_id", chunk.session_id) ||
        !get_u64(*j, "sequence", chunk.sequence) || !get_hex(*j, "data", chunk.data) ||
        !get_string(*j, "chunk_checksum", chunk.chunk_checksum)) {
      return std::nullopt;
    }
    return StreamMessage{std::move(chunk)};
  }
  if (type == "end") {
    return StreamMessage{EndMessage{string_or(*j, "message", "")}};
  }
  if (type == "error") {
    return StreamMessage{AbortMessage{string_or(*j, "message", "transfer aborted")}};
  }
  return std::nullopt;
}

std::string format_chunk_reply(const ChunkReply& reply) {
  switch (reply.kind) {
    case ReplyKind::kOk:
      return std::string(kOkToken);
    case ReplyKind::kRetransmit:
      if (reply.sequence) {
        return std::string(kRetransmitPrefix) + std::to_string(*reply.sequence);
      }
      return std::string(kRetransmitPrefix) + std::string(kLastSequenceToken);
    case ReplyKind::kError:
      return std::string(kErrorToken);
  }
  return std::string(kErrorToken);
}

std::optional<ChunkReply> parse_chunk_reply(std::string_view text) {
  if (text == kOkToken) {
    return make_ok_reply();
  }
  if (text == kErrorToken) {
    return ChunkReply{ReplyKind::kError, std::nullopt};
  }
  if (text.substr(0, kRetransmitPrefix.size()) != kRetransmitPrefix) {
    return std::nullopt;
  }

  const auto argument = text.substr(kRetransmitPrefix.size());
  if (argument == kLastSequenceToken) {
    return make_retransmit_last_reply();
  }
  std::uint64_t sequence = 0;
  const auto* first = argument.data();
  const auto* last = argument.data() + argument.size();
  auto [ptr, ec] = std::from_chars(first, last, sequence);
  if (argument.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return make_retransmit_reply(sequence);
}

ChunkReply make_ok_reply() { return ChunkReply{ReplyKind::kOk, std::nullopt}; }

ChunkReply make_retransmit_reply(std::uint64_t sequence) {
  return ChunkReply{ReplyKind::kRetransmit, sequence};
}

ChunkReply make_retransmit_last_reply() { return ChunkReply{ReplyKind::kRetransmit, std::nullopt}; }

std::string_view to_token(Verdict verdict) {
  switch (verdict) {
    case Verdict::kSuccess:
      return kSuccessToken;
    case Verdict::kChecksumMismatch:
      return kChecksumMismatchToken;
    case Verdict::kError:
      return kErrorToken;
  }
  return kErrorToken;
}

std::optional<Verdict> parse_verdict(std::string_view text) {
  if (text == kSuccessToken) {
    return Verdict::kSuccess;
  }
  if (text == kChecksumMismatchToken) {
    return Verdict::kChecksumMismatch;
  }
  if (text == kErrorToken) {
    return Verdict::kError;
  }
  return std::nullopt;
}

}  // namespace ferry::protocol
