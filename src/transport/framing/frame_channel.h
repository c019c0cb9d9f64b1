#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "transport/tcp_socket/tcp_socket.h"

namespace ferry::transport {

// Wire format of one frame:
//   [length: 4 bytes big-endian]
//   [payload: length bytes]
// The declared length is untrusted: payload storage grows with the bytes that
// actually arrive, and callers may cap the length with set_max_frame_size().
inline constexpr std::size_t kFrameHeaderSize = 4;
// Largest step by which a frame buffer grows while reading.
inline constexpr std::size_t kFrameReadStep = 64 * 1024;

std::array<std::uint8_t, kFrameHeaderSize> encode_frame_header(std::uint32_t length);
std::uint32_t decode_frame_header(std::span<const std::uint8_t, kFrameHeaderSize> header);

struct FrameChannelStats {
  std::uint64_t frames_sent{0};
  std::uint64_t frames_received{0};
  std::uint64_t bytes_sent{0};
  std::uint64_t bytes_received{0};
};

// Length-prefixed message framing over a connected stream.
// A read either yields one complete frame or fails; partial frames are never
// returned. Not thread-safe: one session thread owns the channel.
class FrameChannel {
 public:
  explicit FrameChannel(TcpStream& stream);

  bool write_frame(std::span<const std::uint8_t> payload, std::error_code& ec);
  bool write_text(std::string_view text, std::error_code& ec);

  // ec == std::errc::connection_reset when the stream ends before a full frame
  // (including inside the length prefix), std::errc::timed_out on read timeout,
  // std::errc::message_size when the declared length exceeds the maximum. The
  // oversized payload is not consumed.
  std::optional<std::vector<std::uint8_t>> read_frame(std::error_code& ec);
  std::optional<std::string> read_text(std::error_code& ec);

  // Zero means unbounded.
  void set_max_frame_size(std::size_t max_size) { max_frame_size_ = max_size; }
  [[nodiscard]] std::size_t max_frame_size() const { return max_frame_size_; }

  [[nodiscard]] const FrameChannelStats& stats() const { return stats_; }
  [[nodiscard]] TcpStream& stream() { return stream_; }

 private:
  TcpStream& stream_;
  FrameChannelStats stats_;
  std::size_t max_frame_size_{0};
};

}  // namespace ferry::transport
