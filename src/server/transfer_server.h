#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

#include "server/server_config.h"
#include "server/session_registry.h"
#include "transport/tcp_socket/tcp_socket.h"

namespace ferry::server {

struct ServerStats {
  std::uint64_t connections_total{0};
  std::uint64_t connections_active{0};
  std::uint64_t connections_rejected{0};
  std::uint64_t transfers_succeeded{0};
  std::uint64_t transfers_mismatched{0};
  std::uint64_t transfers_failed{0};
  std::uint64_t bytes_sent{0};
  std::uint64_t bytes_received{0};
};

// Accepts connections and serves one transfer per connection on its own
// thread. Connections beyond max_clients get the busy reply from their own
// short-lived thread, so the accept loop never reads from a client. Finished
// sessions are written to the registry, which a background thread sweeps
// every cleanup_interval.
//
// Thread Safety: stop(), stats(), registry() and local_port() may be called
// from any thread; start() and run() from one owner thread.
class TransferServer {
 public:
  explicit TransferServer(ServerConfig config,
                          std::function<SessionRegistry::TimePoint()> now_fn =
                              SessionRegistry::Clock::now);
  ~TransferServer();

  TransferServer(const TransferServer&) = delete;
  TransferServer& operator=(const TransferServer&) = delete;

  // Bind the listener and start the registry sweeper.
  bool start(std::error_code& ec);

  // Accept loop. Returns after stop() once every connection thread joined.
  void run();

  // Request shutdown. Live connections are shut down so blocked reads fail.
  void stop();

  [[nodiscard]] std::uint16_t local_port() const { return listener_.local_port(); }
  [[nodiscard]] SessionRegistry& registry() { return registry_; }
  [[nodiscard]] ServerStats stats() const;
  [[nodiscard]] bool stopping() const { return stopping_.load(); }

 private:
  struct Connection {
    transport::TcpStream stream;
    std::thread thread;
    std::atomic<bool> done{false};
    // Over the limit; only answered with an error.
    bool rejected{false};
  };

  void dispatch(transport::TcpStream stream);
  void reject(Connection& connection, const std::string& reason);
  void handle_connection(Connection& connection, std::uint64_t session_index);
  void account(const session::SendOutcome& outcome, const transport::FrameChannelStats& io);
  std::size_t reap_finished();
  void shutdown_connections();
  void join_all();
  void sweep_loop();

  ServerConfig config_;
  transport::TcpListener listener_;
  SessionRegistry registry_;
  SessionIdGenerator ids_;

  std::mutex connections_mutex_;
  std::list<std::unique_ptr<Connection>> connections_;
  std::uint64_t next_session_index_{0};

  std::atomic<bool> stopping_{false};
  std::mutex sweep_mutex_;
  std::condition_variable sweep_cv_;
  std::thread sweeper_;

  // Statistics
  std::atomic<std::uint64_t> connections_total_{0};
  std::atomic<std::uint64_t> connections_rejected_{0};
  std::atomic<std::uint64_t> transfers_succeeded_{0};
  std::atomic<std::uint64_t> transfers_mismatched_{0};
  std::atomic<std::uint64_t> transfers_failed_{0};
  std::atomic<std::uint64_t> bytes_sent_{0};
  std::atomic<std::uint64_t> bytes_received_{0};
};

}  // namespace ferry::server
