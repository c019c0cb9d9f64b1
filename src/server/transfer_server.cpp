#include "server/transfer_server.h"

#include <exception>
#include <utility>

#include "common/logging/logger.h"
#include "transfer/protocol/messages.h"
#include "transport/framing/frame_channel.h"

namespace ferry::server {

namespace {
constexpr int kAcceptPollMs = 200;
constexpr int kListenBacklog = 128;
// Bounds for draining a rejected client's request.
constexpr std::chrono::seconds kRejectReadTimeout{1};
constexpr std::size_t kRejectDrainLimit = 16 * 1024 * 1024;
}  // namespace

TransferServer::TransferServer(ServerConfig config,
                               std::function<SessionRegistry::TimePoint()> now_fn)
    : config_(std::move(config)), registry_(config_.record_retention, std::move(now_fn)) {}

TransferServer::~TransferServer() {
  stop();
  join_all();
}

bool TransferServer::start(std::error_code& ec) {
  transport::Endpoint bind_address{config_.listen_address, config_.listen_port};
  if (!listener_.open(bind_address, kListenBacklog, ec)) {
    LOG_ERROR("Failed to listen on {}: {}", transport::to_string(bind_address), ec.message());
    return false;
  }
  LOG_INFO("Listening on {}:{}", config_.listen_address, listener_.local_port());
  if (config_.transfer.fault.enabled) {
    LOG_INFO("Fault simulation enabled, error rate {:.2f}", config_.transfer.fault.rate);
  }

  sweeper_ = std::thread([this] { sweep_loop(); });
  return true;
}

void TransferServer::run() {
  while (!stopping_.load()) {
    transport::TcpStream stream;
    std::error_code ec;
    if (listener_.accept(stream, kAcceptPollMs, ec)) {
      dispatch(std::move(stream));
    } else if (ec) {
      LOG_ERROR("Accept failed: {}", ec.message());
      break;
    }
    reap_finished();
  }

  LOG_INFO("Shutting down...");
  listener_.close();
  stop();
  join_all();
}

void TransferServer::stop() {
  if (!stopping_.exchange(true)) {
    LOG_DEBUG("Stop requested");
  }
  {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
  }
  sweep_cv_.notify_all();
  shutdown_connections();
}

ServerStats TransferServer::stats() const {
  ServerStats stats;
  // Outcome counters first: each is bumped after connections_total_.
  stats.connections_rejected = connections_rejected_.load();
  stats.transfers_succeeded = transfers_succeeded_.load();
  stats.transfers_mismatched = transfers_mismatched_.load();
  stats.transfers_failed = transfers_failed_.load();
  stats.connections_total = connections_total_.load();
  stats.connections_active = stats.connections_total - stats.connections_rejected -
                             stats.transfers_succeeded - stats.transfers_mismatched -
                             stats.transfers_failed;
  stats.bytes_sent = bytes_sent_.load();
  stats.bytes_received = bytes_received_.load();
  return stats;
}

void TransferServer::dispatch(transport::TcpStream stream) {
  connections_total_++;
  const auto peer = stream.remote();

  std::lock_guard<std::mutex> lock(connections_mutex_);
  if (stopping_.load()) {
    // stop() has already shut down the live connections and would miss this one.
    connections_rejected_++;
    LOG_DEBUG("Dropping {} accepted during shutdown", transport::to_string(peer));
    stream.shutdown();
    return;
  }

  std::size_t sessions = 0;
  std::size_t rejecting = 0;
  for (const auto& connection : connections_) {
    if (connection->done.load()) {
      continue;
    }
    if (connection->rejected) {
      ++rejecting;
    } else {
      ++sessions;
    }
  }

  if (sessions < config_.max_clients) {
    LOG_INFO("Client connected from {}", transport::to_string(peer));
    auto connection = std::make_unique<Connection>();
    connection->stream = std::move(stream);
    auto* raw = connection.get();
    const std::uint64_t index = next_session_index_++;
    connections_.push_back(std::move(connection));
    raw->thread = std::thread([this, raw, index] { handle_connection(*raw, index); });
    return;
  }

  connections_rejected_++;
  LOG_WARN("Connection limit {} reached, rejecting {}", config_.max_clients,
           transport::to_string(peer));
  if (rejecting >= config_.max_clients) {
    LOG_DEBUG("Too many pending rejections, closing {} without a reply",
              transport::to_string(peer));
    stream.shutdown();
    return;
  }

  auto connection = std::make_unique<Connection>();
  connection->stream = std::move(stream);
  connection->rejected = true;
  auto* raw = connection.get();
  connections_.push_back(std::move(connection));
  raw->thread = std::thread([this, raw] { reject(*raw, "Server busy, try again later"); });
}

void TransferServer::reject(Connection& connection, const std::string& reason) {
  auto& stream = connection.stream;
  std::error_code ec;
  transport::FrameChannel channel(stream);
  // Consume the request first so closing does not reset the connection under
  // the unread upload. Requests above the drain limit are left unread.
  channel.set_max_frame_size(kRejectDrainLimit);
  if (stream.set_read_timeout(kRejectReadTimeout, ec)) {
    if (!channel.read_frame(ec)) {
      LOG_DEBUG("No request from rejected client: {}", ec.message());
    }
  }
  if (!channel.write_text(protocol::encode(protocol::ErrorResponse{reason}), ec)) {
    LOG_DEBUG("Failed to send rejection: {}", ec.message());
  }
  stream.shutdown();
  connection.done = true;
}

void TransferServer::handle_connection(Connection& connection, std::uint64_t session_index) {
  auto& stream = connection.stream;
  const auto peer = stream.remote();
  const auto created_at = registry_.now();

  std::error_code ec;
  if (!stream.set_read_timeout(config_.read_timeout, ec)) {
    LOG_WARN("Failed to set read timeout for {}: {}", transport::to_string(peer), ec.message());
  }

  session::SenderConfig sender_config = config_.transfer;
  if (sender_config.fault.seed) {
    // Distinct but reproducible sequence per session.
    *sender_config.fault.seed += session_index;
  }

  transport::FrameChannel channel(stream);
  session::SendOutcome outcome;
  outcome.session_id = ids_.next(peer);
  try {
    session::SenderSession session(channel, outcome.session_id, sender_config);
    outcome = session.serve();
  } catch (const std::exception& e) {
    LOG_ERROR("[{}] Session aborted: {}", outcome.session_id, e.what());
    outcome.state = session::TransferState::kFailed;
    outcome.error = e.what();
  }
  stream.shutdown();
  account(outcome, channel.stats());

  SessionRecord record;
  record.session_id = outcome.session_id;
  record.peer = peer;
  record.state = outcome.state;
  record.file_name = outcome.file_name;
  record.checksum = outcome.checksum;
  record.file_size = outcome.file_size;
  record.chunk_size = outcome.chunk_size;
  record.total_chunks = outcome.total_chunks;
  record.stats = outcome.stats;
  record.created_at = created_at;
  record.finished_at = registry_.now();
  record.error = outcome.error;
  if (!registry_.record(std::move(record))) {
    LOG_WARN("[{}] Session record not stored", outcome.session_id);
  }
  LOG_INFO("Client {} disconnected, session {} ended {}", transport::to_string(peer),
           outcome.session_id, session::to_string(outcome.state));
  connection.done = true;
}

void TransferServer::account(const session::SendOutcome& outcome,
                             const transport::FrameChannelStats& io) {
  bytes_sent_ += io.bytes_sent;
  bytes_received_ += io.bytes_received;
  switch (outcome.state) {
    case session::TransferState::kSuccess:
      transfers_succeeded_++;
      break;
    case session::TransferState::kMismatch:
      transfers_mismatched_++;
      break;
    default:
      transfers_failed_++;
      break;
  }
}

std::size_t TransferServer::reap_finished() {
  std::list<std::unique_ptr<Connection>> finished;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
      if ((*it)->done.load()) {
        finished.push_back(std::move(*it));
        it = connections_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& connection : finished) {
    if (connection->thread.joinable()) {
      connection->thread.join();
    }
  }
  return finished.size();
}

void TransferServer::shutdown_connections() {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  for (auto& connection : connections_) {
    if (!connection->done.load()) {
      connection->stream.shutdown();
    }
  }
}

void TransferServer::join_all() {
  std::list<std::unique_ptr<Connection>> remaining;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    remaining.swap(connections_);
  }
  for (auto& connection : remaining) {
    if (connection->thread.joinable()) {
      connection->thread.join();
    }
  }
  if (sweeper_.joinable()) {
    sweeper_.join();
  }
}

void TransferServer::sweep_loop() {
  std::unique_lock<std::mutex> lock(sweep_mutex_);
  while (!stopping_.load()) {
    sweep_cv_.wait_for(lock, config_.cleanup_interval, [this] { return stopping_.load(); });
    if (stopping_.load()) {
      break;
    }
    const auto removed = registry_.cleanup_expired();
    if (removed > 0) {
      LOG_INFO("Cleaned up {} expired session records", removed);
    }
  }
}

}  // namespace ferry::server
