#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <system_error>

namespace ferry::transport {

struct Endpoint {
  std::string host;
  std::uint16_t port{0};
};

std::string to_string(const Endpoint& endpoint);

// Connected byte stream. Owns its file descriptor.
//
// Failure reporting:
//   - the peer closing the stream surfaces as std::errc::connection_reset,
//   - an expired read timeout surfaces as std::errc::timed_out,
//   - everything else carries the errno of the failing call.
class TcpStream {
 public:
  TcpStream();
  // Adopt an already connected descriptor (accept(), socketpair()).
  explicit TcpStream(int fd, Endpoint remote = {});
  ~TcpStream();

  TcpStream(const TcpStream&) = delete;
  TcpStream& operator=(const TcpStream&) = delete;
  TcpStream(TcpStream&& other) noexcept;
  TcpStream& operator=(TcpStream&& other) noexcept;

  bool connect(const Endpoint& remote, std::error_code& ec);

  // Zero disables the timeout.
  bool set_read_timeout(std::chrono::milliseconds timeout, std::error_code& ec);

  bool write_all(std::span<const std::uint8_t> data, std::error_code& ec);

  // Blocks until out.size() bytes were read, looping on short reads.
  bool read_exact(std::span<std::uint8_t> out, std::error_code& ec);

  // Wake up a reader blocked on this stream from another thread.
  void shutdown();
  void close();

  [[nodiscard]] bool is_open() const { return fd_ >= 0; }
  [[nodiscard]] int fd() const { return fd_; }
  [[nodiscard]] const Endpoint& remote() const { return remote_; }

 private:
  int fd_{-1};
  Endpoint remote_;
};

class TcpListener {
 public:
  TcpListener();
  ~TcpListener();

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;
  TcpListener(TcpListener&&) = delete;
  TcpListener& operator=(TcpListener&&) = delete;

  bool open(const Endpoint& bind_address, int backlog, std::error_code& ec);

  // Wait up to timeout_ms for a connection.
  // Returns true with out populated when a client was accepted, false otherwise;
  // ec is only set on real errors, not on an idle timeout.
  bool accept(TcpStream& out, int timeout_ms, std::error_code& ec);

  void close();

  [[nodiscard]] bool is_open() const { return fd_ >= 0; }

  // Actual bound port; useful after binding port 0.
  [[nodiscard]] std::uint16_t local_port() const;

 private:
  int fd_{-1};
};

}  // namespace ferry::transport
