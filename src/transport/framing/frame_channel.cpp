#include "transport/framing/frame_channel.h"

#include <algorithm>
#include <limits>

namespace ferry::transport {

std::array<std::uint8_t, kFrameHeaderSize> encode_frame_header(std::uint32_t length) {
  return {static_cast<std::uint8_t>((length >> 24) & 0xFF),
          static_cast<std::uint8_t>((length >> 16) & 0xFF),
          static_cast<std::uint8_t>((length >> 8) & 0xFF),
          static_cast<std::uint8_t>(length & 0xFF)};
}

std::uint32_t decode_frame_header(std::span<const std::uint8_t, kFrameHeaderSize> header) {
  return (static_cast<std::uint32_t>(header[0]) << 24) |
         (static_cast<std::uint32_t>(header[1]) << 16) |
         (static_cast<std::uint32_t>(header[2]) << 8) | static_cast<std::uint32_t>(header[3]);
}

FrameChannel::FrameChannel(TcpStream& stream) : stream_(stream) {}

bool FrameChannel::write_frame(std::span<const std::uint8_t> payload, std::error_code& ec) {
  if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
    ec = std::make_error_code(std::errc::message_size);
    return false;
  }

  // One contiguous buffer keeps header and payload in the same send() where possible.
  const auto header = encode_frame_header(static_cast<std::uint32_t>(payload.size()));
  std::vector<std::uint8_t> out;
  out.reserve(kFrameHeaderSize + payload.size());
  out.insert(out.end(), header.begin(), header.end());
  out.insert(out.end(), payload.begin(), payload.end());

  if (!stream_.write_all(out, ec)) {
    return false;
  }
  stats_.frames_sent++;
  stats_.bytes_sent += out.size();
  return true;
}

bool FrameChannel::write_text(std::string_view text, std::error_code& ec) {
  return write_frame(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()),
      ec);
}

std::optional<std::vector<std::uint8_t>> FrameChannel::read_frame(std::error_code& ec) {
  std::array<std::uint8_t, kFrameHeaderSize> header{};
  if (!stream_.read_exact(header, ec)) {
    return std::nullopt;
  }

  const std::uint32_t length = decode_frame_header(header);
  if (max_frame_size_ != 0 && length > max_frame_size_) {
    ec = std::make_error_code(std::errc::message_size);
    return std::nullopt;
  }

  // Grow in steps so a forged length costs no more memory than the peer sends.
  std::vector<std::uint8_t> payload;
  while (payload.size() < length) {
    const std::size_t offset = payload.size();
    const std::size_t step = std::min<std::size_t>(length - offset, kFrameReadStep);
    payload.resize(offset + step);
    if (!stream_.read_exact(std::span<std::uint8_t>(payload).subspan(offset, step), ec)) {
      return std::nullopt;
    }
  }

  stats_.frames_received++;
  stats_.bytes_received += kFrameHeaderSize + payload.size();
  return payload;
}

std::optional<std::string> FrameChannel::read_text(std::error_code& ec) {
  auto frame = read_frame(ec);
  if (!frame) {
    return std::nullopt;
  }
  return std::string(frame->begin(), frame->end());
}

}  // namespace ferry::transport
