#include "transport/tcp_socket/tcp_socket.h"

#include <arpa/inet.h>
#include <cerrno>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <array>
#include <cstring>
#include <utility>

#include "common/logging/logger.h"

namespace {

std::error_code last_error() { return std::error_code(errno, std::generic_category()); }

// SO_RCVTIMEO expiry is reported as EAGAIN/EWOULDBLOCK on a blocking socket.
std::error_code read_error() {
  if (errno == EAGAIN || errno == EWOULDBLOCK) {
    return std::make_error_code(std::errc::timed_out);
  }
  if (errno == ECONNRESET || errno == EPIPE) {
    return std::make_error_code(std::errc::connection_reset);
  }
  return last_error();
}

void fill_endpoint(const sockaddr_in& addr, ferry::transport::Endpoint& endpoint) {
  std::array<char, INET_ADDRSTRLEN> buffer{};
  const char* res = inet_ntop(AF_INET, &addr.sin_addr, buffer.data(), buffer.size());
  endpoint.host = (res != nullptr) ? buffer.data() : "";
  endpoint.port = ntohs(addr.sin_port);
}

}  // namespace

namespace ferry::transport {

std::string to_string(const Endpoint& endpoint) {
  return endpoint.host + ":" + std::to_string(endpoint.port);
}

TcpStream::TcpStream() = default;

TcpStream::TcpStream(int fd, Endpoint remote) : fd_(fd), remote_(std::move(remote)) {}

TcpStream::~TcpStream() { close(); }

TcpStream::TcpStream(TcpStream&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), remote_(std::move(other.remote_)) {}

TcpStream& TcpStream::operator=(TcpStream&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    remote_ = std::move(other.remote_);
  }
  return *this;
}

bool TcpStream::connect(const Endpoint& remote, std::error_code& ec) {
  if (is_open()) {
    ec = std::make_error_code(std::errc::already_connected);
    return false;
  }

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* results = nullptr;
  const std::string port = std::to_string(remote.port);
  const int rc = ::getaddrinfo(remote.host.c_str(), port.c_str(), &hints, &results);
  if (rc != 0) {
    LOG_ERROR("Cannot resolve {}: {}", remote.host, gai_strerror(rc));
    ec = std::make_error_code(std::errc::host_unreachable);
    return false;
  }

  ec = std::make_error_code(std::errc::host_unreachable);
  for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
      ec = last_error();
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      fd_ = fd;
      ec.clear();
      break;
    }
    ec = last_error();
    ::close(fd);
  }
  ::freeaddrinfo(results);

  if (fd_ < 0) {
    return false;
  }

  const int enable = 1;
  if (::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &enable, sizeof(enable)) != 0) {
    LOG_DEBUG("TCP_NODELAY not applied: {}", std::strerror(errno));
  }
  remote_ = remote;
  return true;
}

bool TcpStream::set_read_timeout(std::chrono::milliseconds timeout, std::error_code& ec) {
  if (!is_open()) {
    ec = std::make_error_code(std::errc::not_connected);
    return false;
  }
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
    ec = last_error();
    return false;
  }
  return true;
}

bool TcpStream::write_all(std::span<const std::uint8_t> data, std::error_code& ec) {
  if (!is_open()) {
    ec = std::make_error_code(std::errc::not_connected);
    return false;
  }
  std::size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ec = (errno == EPIPE || errno == ECONNRESET) ? std::make_error_code(std::errc::connection_reset)
                                                  : last_error();
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

bool TcpStream::read_exact(std::span<std::uint8_t> out, std::error_code& ec) {
  if (!is_open()) {
    ec = std::make_error_code(std::errc::not_connected);
    return false;
  }
  std::size_t got = 0;
  while (got < out.size()) {
    const ssize_t n = ::recv(fd_, out.data() + got, out.size() - got, 0);
    if (n == 0) {
      ec = std::make_error_code(std::errc::connection_reset);
      return false;
    }
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ec = read_error();
      return false;
    }
    got += static_cast<std::size_t>(n);
  }
  return true;
}

void TcpStream::shutdown() {
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
}

void TcpStream::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

TcpListener::TcpListener() = default;

TcpListener::~TcpListener() { close(); }

bool TcpListener::open(const Endpoint& bind_address, int backlog, std::error_code& ec) {
  if (is_open()) {
    ec = std::make_error_code(std::errc::already_connected);
    return false;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(bind_address.port);
  if (bind_address.host.empty()) {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, bind_address.host.c_str(), &addr.sin_addr) != 1) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd_ < 0) {
    ec = last_error();
    return false;
  }

  const int enable = 1;
  if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) != 0) {
    ec = last_error();
    close();
    return false;
  }

  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    ec = last_error();
    close();
    return false;
  }

  if (::listen(fd_, backlog) != 0) {
    ec = last_error();
    close();
    return false;
  }
  return true;
}

bool TcpListener::accept(TcpStream& out, int timeout_ms, std::error_code& ec) {
  if (!is_open()) {
    ec = std::make_error_code(std::errc::not_connected);
    return false;
  }

  pollfd pfd{};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  const int ready = ::poll(&pfd, 1, timeout_ms);
  if (ready < 0) {
    if (errno != EINTR) {
      ec = last_error();
    }
    return false;
  }
  if (ready == 0) {
    return false;
  }

  sockaddr_in peer{};
  socklen_t len = sizeof(peer);
  const int fd = ::accept4(fd_, reinterpret_cast<sockaddr*>(&peer), &len, SOCK_CLOEXEC);
  if (fd < 0) {
    // The pending connection may have been reset between poll() and accept().
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNABORTED || errno == EINTR) {
      return false;
    }
    ec = last_error();
    return false;
  }

  Endpoint remote;
  fill_endpoint(peer, remote);
  out = TcpStream(fd, std::move(remote));
  return true;
}

void TcpListener::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

std::uint16_t TcpListener::local_port() const {
  if (fd_ < 0) {
    return 0;
  }
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return 0;
  }
  return ntohs(addr.sin_port);
}

}  // namespace ferry::transport
