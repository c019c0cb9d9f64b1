#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ferry::protocol {

// ============================================================================
// Transfer protocol - JSON documents and literal tokens, one per frame
// ============================================================================
//
//   client -> server   {"command":"upload","file_name":..,"file_size":..,
//                       "file_data":<hex>,"chunk_size"?:..,"retry_budget"?:..}
//   server -> client   {"status":"ready","session_id":..,"checksum":<hex256>,
//                       "total_chunks":..,"chunk_size":..,"file_size":..}
//                   or {"status":"error","message":..}
//   client -> server   READY
//   server -> client   {"type":"chunk","session_id":..,"sequence":..,
//                       "data":<hex>,"chunk_checksum":<hex128>}
//   client -> server   OK | RETRANSMIT:<seq> | RETRANSMIT:LAST | ERROR
//   server -> client   {"type":"end","message":..} | {"type":"error","message":..}
//   client -> server   SUCCESS | CHECKSUM_MISMATCH | ERROR

inline constexpr std::string_view kReadyToken = "READY";
inline constexpr std::string_view kOkToken = "OK";
inline constexpr std::string_view kRetransmitPrefix = "RETRANSMIT:";
inline constexpr std::string_view kLastSequenceToken = "LAST";
inline constexpr std::string_view kErrorToken = "ERROR";
inline constexpr std::string_view kSuccessToken = "SUCCESS";
inline constexpr std::string_view kChecksumMismatchToken = "CHECKSUM_MISMATCH";

struct UploadRequest {
  std::string file_name;
  std::vector<std::uint8_t> file_data;
  // Optional per-transfer overrides of the server defaults.
  std::optional<std::size_t> chunk_size;
  std::optional<std::size_t> retry_budget;
};

struct TransferMetadata {
  std::string session_id;
  std::string checksum;  // hex SHA-256 of the whole file
  std::uint64_t total_chunks{0};
  std::uint64_t chunk_size{0};
  std::uint64_t file_size{0};
};

struct ErrorResponse {
  std::string message;
};

struct ChunkMessage {
  std::string session_id;
  std::uint64_t sequence{0};
  std::vector<std::uint8_t> data;
  std::string chunk_checksum;  // hex, 128-bit
};

struct EndMessage {
  std::string message;
};

// Sender gave up on the transfer (retry budget exhausted, internal error).
struct AbortMessage {
  std::string message;
};

using MetadataResponse = std::variant<TransferMetadata, ErrorResponse>;
using StreamMessage = std::variant<ChunkMessage, EndMessage, AbortMessage>;

enum class ReplyKind { kOk, kRetransmit, kError };

struct ChunkReply {
  ReplyKind kind{ReplyKind::kOk};
  // Set for kRetransmit; nullopt means "the chunk you sent last".
  std::optional<std::uint64_t> sequence;
};

enum class Verdict { kSuccess, kChecksumMismatch, kError };

std::string encode(const UploadRequest& request);
std::string encode(const TransferMetadata& metadata);
std::string encode(const ErrorResponse& response);
std::string encode(const ChunkMessage& chunk);
std::string encode(const EndMessage& end);
std::string encode(const AbortMessage& abort);

// Decoders return nullopt on malformed input: invalid JSON, a missing or
// mistyped field, invalid hex, or an unknown discriminator.

// The command name is reported through unknown_command when the document is
// well formed but not an upload.
std::optional<UploadRequest> parse_upload_request(std::string_view text,
                                                  std::string* unknown_command = nullptr);
std::optional<MetadataResponse> parse_metadata_response(std::string_view text);
std::optional<StreamMessage> parse_stream_message(std::string_view text);

std::string format_chunk_reply(const ChunkReply& reply);
std::optional<ChunkReply> parse_chunk_reply(std::string_view text);

ChunkReply make_ok_reply();
ChunkReply make_retransmit_reply(std::uint64_t sequence);
ChunkReply make_retransmit_last_reply();

std::string_view to_token(Verdict verdict);
std::optional<Verdict> parse_verdict(std::string_view text);

}  // namespace ferry::protocol
