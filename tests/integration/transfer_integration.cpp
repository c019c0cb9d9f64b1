/**
 * End-to-end transfer integration tests
 *
 * A real TransferServer listens on an ephemeral loopback port and real
 * TransferClient instances upload buffers and files through it:
 *
 * Client -> upload -> Server -> split/perturb -> chunks -> Client -> verify
 *
 * Covered: clean and lossy transfers, empty and single-chunk files, several
 * concurrent clients, retry budget exhaustion, the connection limit and the
 * session records the server keeps.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <variant>
#include <vector>

#include "client/transfer_client.h"
#include "server/transfer_server.h"
#include "transfer/protocol/messages.h"
#include "transport/framing/frame_channel.h"
#include "transport/tcp_socket/tcp_socket.h"

namespace ferry::integration_tests {

using namespace std::chrono_literals;
using session::TransferState;

namespace {
std::vector<std::uint8_t> make_data(std::size_t size, std::uint8_t salt = 0) {
  std::vector<std::uint8_t> data(size);
  for (std::size_t i = 0; i < size; ++i) {
    data[i] = static_cast<std::uint8_t>((i * 7 + salt + i / 251) & 0xFF);
  }
  return data;
}
}  // namespace

class TransferIntegrationTest : public ::testing::Test {
 protected:
  void TearDown() override {
    if (server_) {
      server_->stop();
    }
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
    server_.reset();
    if (!temp_dir_.empty()) {
      std::error_code ec;
      std::filesystem::remove_all(temp_dir_, ec);
    }
  }

  // Start a server on an ephemeral port. Returns false (after GTEST_SKIP) when
  // the environment forbids listening sockets.
  bool start_server(server::ServerConfig config, std::chrono::seconds read_timeout = 10s) {
    config.listen_address = "127.0.0.1";
    config.listen_port = 0;
    config.read_timeout = read_timeout;
    server_ = std::make_unique<server::TransferServer>(std::move(config));

    std::error_code ec;
    if (!server_->start(ec)) {
      if (ec == std::errc::operation_not_permitted || ec == std::errc::permission_denied) {
        skipped_ = true;
        return false;
      }
      ADD_FAILURE() << "server failed to start: " << ec.message();
      return false;
    }
    server_thread_ = std::thread([this] { server_->run(); });
    return true;
  }

  client::ClientConfig client_config() const {
    client::ClientConfig config;
    config.server_address = "127.0.0.1";
    config.server_port = server_->local_port();
    config.read_timeout = 10s;
    return config;
  }

  session::UploadOutcome upload(const std::vector<std::uint8_t>& data,
                                client::ClientConfig config) {
    client::TransferClient client(std::move(config));
    return client.upload_buffer(data, "payload.bin");
  }

  // Poll a server counter until it reaches the expected value.
  template <typename Counter>
  bool wait_for(Counter counter, std::uint64_t expected) {
    for (int i = 0; i < 150; ++i) {
      if (counter(server_->stats()) >= expected) {
        return true;
      }
      std::this_thread::sleep_for(20ms);
    }
    return false;
  }

  // Records are written after the connection closes; wait for them.
  std::optional<server::SessionRecord> wait_for_record(const std::string& session_id) {
    for (int i = 0; i < 100; ++i) {
      if (auto record = server_->registry().find(session_id)) {
        return record;
      }
      std::this_thread::sleep_for(20ms);
    }
    return std::nullopt;
  }

  std::filesystem::path make_temp_dir() {
    temp_dir_ = std::filesystem::temp_directory_path() /
                ("ferry_it_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)));
    std::filesystem::create_directories(temp_dir_);
    return temp_dir_;
  }

  std::unique_ptr<server::TransferServer> server_;
  std::thread server_thread_;
  std::filesystem::path temp_dir_;
  bool skipped_{false};
};

#define FERRY_START_SERVER(...)                                         \
  do {                                                                  \
    if (!start_server(__VA_ARGS__)) {                                   \
      if (skipped_) {                                                   \
        GTEST_SKIP() << "TCP listen not permitted in this environment"; \
      }                                                                 \
      return;                                                           \
    }                                                                   \
  } while (0)

// ============================================================================
// Basic transfers
// ============================================================================

TEST_F(TransferIntegrationTest, CleanTransferOf10KB) {
  FERRY_START_SERVER(server::ServerConfig{});

  const auto data = make_data(10 * 1024);
  auto outcome = upload(data, client_config());

  ASSERT_EQ(outcome.state, TransferState::kSuccess) << outcome.error;
  EXPECT_EQ(outcome.data, data);
  EXPECT_EQ(outcome.total_chunks, 10u);
  EXPECT_EQ(outcome.stats.retransmit_requests, 0u);
}

TEST_F(TransferIntegrationTest, LossyTransferStillVerifies) {
  server::ServerConfig config;
  config.transfer.fault.enabled = true;
  config.transfer.fault.rate = 0.5;
  config.transfer.fault.seed = 11;
  FERRY_START_SERVER(config);

  const auto data = make_data(10 * 1024, 3);
  auto outcome = upload(data, client_config());

  ASSERT_EQ(outcome.state, TransferState::kSuccess) << outcome.error;
  EXPECT_EQ(outcome.data, data);
  EXPECT_EQ(outcome.computed_checksum, outcome.declared_checksum);

  auto record = wait_for_record(outcome.session_id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->state, TransferState::kSuccess);
  EXPECT_EQ(record->stats.retransmissions,
            record->stats.chunks_dropped + record->stats.chunks_corrupted);
}

TEST_F(TransferIntegrationTest, EmptyFile) {
  FERRY_START_SERVER(server::ServerConfig{});

  auto outcome = upload({}, client_config());

  ASSERT_EQ(outcome.state, TransferState::kSuccess) << outcome.error;
  EXPECT_EQ(outcome.total_chunks, 0u);
  EXPECT_TRUE(outcome.data.empty());
}

TEST_F(TransferIntegrationTest, FileOfExactlyOneChunk) {
  FERRY_START_SERVER(server::ServerConfig{});

  auto config = client_config();
  config.chunk_size = 512;
  const auto data = make_data(512);
  auto outcome = upload(data, config);

  ASSERT_EQ(outcome.state, TransferState::kSuccess) << outcome.error;
  EXPECT_EQ(outcome.total_chunks, 1u);
  EXPECT_EQ(outcome.data, data);
}

TEST_F(TransferIntegrationTest, UploadFileWritesVerifiedCopy) {
  FERRY_START_SERVER(server::ServerConfig{});

  const auto dir = make_temp_dir();
  const auto input = dir / "report.dat";
  const auto data = make_data(3000, 9);
  std::error_code ec;
  ASSERT_TRUE(client::write_file(input.string(), data, ec)) << ec.message();

  auto config = client_config();
  config.input_file = input.string();
  config.output_file = client::default_output_path(config.input_file);
  client::TransferClient client(config);
  auto report = client.upload_file();

  EXPECT_EQ(client::exit_code(report), client::kExitSuccess) << report.outcome.error;
  EXPECT_EQ(report.attempts, 1u);
  EXPECT_TRUE(report.saved);
  EXPECT_EQ(report.output_file, (dir / "report_received.dat").string());

  std::vector<std::uint8_t> copy;
  ASSERT_TRUE(client::read_file(report.output_file, copy, ec)) << ec.message();
  EXPECT_EQ(copy, data);
}

TEST_F(TransferIntegrationTest, FailedUploadIsRetriedUpToMaxRetries) {
  server::ServerConfig config;
  config.transfer.fault.enabled = true;
  config.transfer.fault.rate = 1.0;
  config.transfer.fault.seed = 42;
  FERRY_START_SERVER(config);

  const auto dir = make_temp_dir();
  const auto input = dir / "doomed.bin";
  std::error_code ec;
  ASSERT_TRUE(client::write_file(input.string(), make_data(20 * 1024), ec)) << ec.message();

  auto client_settings = client_config();
  client_settings.input_file = input.string();
  client_settings.output_file = client::default_output_path(client_settings.input_file);
  client_settings.retry_budget = 1;
  client_settings.max_retries = 2;
  client::TransferClient client(client_settings);
  auto report = client.upload_file();

  EXPECT_EQ(report.attempts, 3u);
  EXPECT_EQ(report.outcome.state, TransferState::kFailed);
  EXPECT_FALSE(report.saved);
  EXPECT_EQ(client::exit_code(report), client::kExitFailure);
  EXPECT_FALSE(std::filesystem::exists(client_settings.output_file));

  // Each attempt was a separate session on the server.
  EXPECT_TRUE(wait_for([](const server::ServerStats& s) { return s.transfers_failed; }, 3));
  EXPECT_EQ(server_->stats().connections_total, 3u);
}

TEST_F(TransferIntegrationTest, ZeroMaxRetriesMakesOneAttempt) {
  server::ServerConfig config;
  config.transfer.fault.enabled = true;
  config.transfer.fault.rate = 1.0;
  config.transfer.fault.seed = 42;
  FERRY_START_SERVER(config);

  const auto dir = make_temp_dir();
  const auto input = dir / "once.bin";
  std::error_code ec;
  ASSERT_TRUE(client::write_file(input.string(), make_data(20 * 1024), ec)) << ec.message();

  auto client_settings = client_config();
  client_settings.input_file = input.string();
  client_settings.output_file = client::default_output_path(client_settings.input_file);
  client_settings.retry_budget = 1;
  client_settings.max_retries = 0;
  client::TransferClient client(client_settings);
  auto report = client.upload_file();

  EXPECT_EQ(report.attempts, 1u);
  EXPECT_EQ(client::exit_code(report), client::kExitFailure);
}

// ============================================================================
// Concurrency and limits
// ============================================================================

TEST_F(TransferIntegrationTest, ConcurrentClientsAreIsolated) {
  server::ServerConfig config;
  config.transfer.fault.enabled = true;
  config.transfer.fault.rate = 0.2;
  config.transfer.fault.seed = 99;
  FERRY_START_SERVER(config);

  constexpr int kClients = 8;
  std::vector<session::UploadOutcome> outcomes(kClients);
  std::vector<std::vector<std::uint8_t>> inputs;
  for (int i = 0; i < kClients; ++i) {
    inputs.push_back(make_data(4096 + static_cast<std::size_t>(i) * 333,
                               static_cast<std::uint8_t>(i * 29)));
  }

  std::vector<std::thread> threads;
  for (int i = 0; i < kClients; ++i) {
    threads.emplace_back([&, i] { outcomes[i] = upload(inputs[i], client_config()); });
  }
  for (auto& t : threads) {
    t.join();
  }

  for (int i = 0; i < kClients; ++i) {
    EXPECT_EQ(outcomes[i].state, TransferState::kSuccess) << i << ": " << outcomes[i].error;
    EXPECT_EQ(outcomes[i].data, inputs[i]) << "client " << i;
    for (int j = 0; j < i; ++j) {
      EXPECT_NE(outcomes[i].session_id, outcomes[j].session_id);
    }
  }
}

TEST_F(TransferIntegrationTest, ExhaustedRetryBudgetFailsTheTransfer) {
  server::ServerConfig config;
  config.transfer.fault.enabled = true;
  config.transfer.fault.rate = 1.0;
  config.transfer.fault.seed = 1;
  FERRY_START_SERVER(config);

  auto client = client_config();
  client.retry_budget = 2;
  auto outcome = upload(make_data(20 * 1024), client);

  EXPECT_EQ(outcome.state, TransferState::kFailed);
  EXPECT_TRUE(outcome.data.empty());

  auto record = wait_for_record(outcome.session_id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->state, TransferState::kFailed);
  EXPECT_EQ(record->stats.retransmissions, 2u);
  EXPECT_NE(record->error.find("retry budget"), std::string::npos) << record->error;
}

TEST_F(TransferIntegrationTest, ConnectionLimitRejectsExtraClients) {
  server::ServerConfig config;
  config.max_clients = 1;
  FERRY_START_SERVER(config);

  // Occupy the only slot with a connection that never sends its request.
  transport::TcpStream hog;
  std::error_code ec;
  ASSERT_TRUE(hog.connect({"127.0.0.1", server_->local_port()}, ec)) << ec.message();
  for (int i = 0; i < 100 && server_->stats().connections_active == 0; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_EQ(server_->stats().connections_active, 1u);

  auto outcome = upload(make_data(100), client_config());
  EXPECT_EQ(outcome.state, TransferState::kFailed);
  EXPECT_NE(outcome.error.find("Server busy"), std::string::npos) << outcome.error;
  EXPECT_EQ(server_->stats().connections_rejected, 1u);

  hog.close();
}

TEST_F(TransferIntegrationTest, ForgedLengthFromRejectedClientDoesNotStallAccepts) {
  server::ServerConfig config;
  config.max_clients = 1;
  FERRY_START_SERVER(config);
  const transport::Endpoint endpoint{"127.0.0.1", server_->local_port()};

  transport::TcpStream hog;
  std::error_code ec;
  ASSERT_TRUE(hog.connect(endpoint, ec)) << ec.message();
  ASSERT_TRUE(wait_for([](const server::ServerStats& s) { return s.connections_active; }, 1));

  // Over the limit: declare a 4 GiB request, then trickle bytes slowly.
  transport::TcpStream forger;
  ASSERT_TRUE(forger.connect(endpoint, ec)) << ec.message();
  std::atomic<bool> trickling{true};
  std::thread trickle([&] {
    const std::vector<std::uint8_t> header{0xFF, 0xFF, 0xFF, 0xFF};
    std::error_code write_ec;
    if (!forger.write_all(header, write_ec)) {
      return;
    }
    const std::vector<std::uint8_t> byte{'A'};
    while (trickling.load() && forger.write_all(byte, write_ec)) {
      std::this_thread::sleep_for(300ms);
    }
  });
  EXPECT_TRUE(wait_for([](const server::ServerStats& s) { return s.connections_rejected; }, 1));

  // Free the slot; the next client must be served while the forger is still connected.
  hog.close();
  ASSERT_TRUE(wait_for([](const server::ServerStats& s) { return s.transfers_failed; }, 1));

  const auto started = std::chrono::steady_clock::now();
  const auto data = make_data(4096);
  auto outcome = upload(data, client_config());
  const auto elapsed = std::chrono::steady_clock::now() - started;

  trickling = false;
  forger.shutdown();
  trickle.join();

  EXPECT_EQ(outcome.state, TransferState::kSuccess) << outcome.error;
  EXPECT_EQ(outcome.data, data);
  EXPECT_LT(elapsed, 3s);
}

TEST_F(TransferIntegrationTest, StopReturnsWithIdleConnectionsAndNoReadTimeout) {
  // Zero read timeout: only stop() can unblock a session waiting for its request.
  FERRY_START_SERVER(server::ServerConfig{}, 0s);

  transport::TcpStream idle;
  std::error_code ec;
  ASSERT_TRUE(idle.connect({"127.0.0.1", server_->local_port()}, ec)) << ec.message();
  ASSERT_TRUE(wait_for([](const server::ServerStats& s) { return s.connections_active; }, 1));

  const auto started = std::chrono::steady_clock::now();
  server_->stop();
  server_thread_.join();
  EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
  EXPECT_EQ(server_->stats().connections_active, 0u);
}

TEST_F(TransferIntegrationTest, ConnectionArrivingDuringStopIsNotServed) {
  FERRY_START_SERVER(server::ServerConfig{}, 0s);
  const transport::Endpoint endpoint{"127.0.0.1", server_->local_port()};

  server_->stop();
  // Lands in the accept poll that is still running, or is refused once it ends.
  transport::TcpStream late;
  std::error_code ec;
  if (late.connect(endpoint, ec)) {
    ASSERT_TRUE(late.set_read_timeout(5s, ec)) << ec.message();
    transport::FrameChannel channel(late);
    EXPECT_FALSE(channel.read_frame(ec).has_value());
    EXPECT_NE(ec, std::errc::timed_out);
  }

  const auto started = std::chrono::steady_clock::now();
  server_thread_.join();
  EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
}

TEST_F(TransferIntegrationTest, UnknownCommandGetsErrorResponse) {
  FERRY_START_SERVER(server::ServerConfig{});

  transport::TcpStream stream;
  std::error_code ec;
  ASSERT_TRUE(stream.connect({"127.0.0.1", server_->local_port()}, ec)) << ec.message();
  ASSERT_TRUE(stream.set_read_timeout(5s, ec)) << ec.message();
  transport::FrameChannel channel(stream);
  ASSERT_TRUE(channel.write_text(R"({"command":"list"})", ec)) << ec.message();

  auto text = channel.read_text(ec);
  ASSERT_TRUE(text.has_value()) << ec.message();
  auto response = protocol::parse_metadata_response(*text);
  ASSERT_TRUE(response.has_value()) << *text;
  const auto* error = std::get_if<protocol::ErrorResponse>(&*response);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->message, "Unknown command: list");
}

TEST_F(TransferIntegrationTest, ClientReportsUnreachableServer) {
  FERRY_START_SERVER(server::ServerConfig{});
  auto config = client_config();
  server_->stop();
  server_thread_.join();

  auto outcome = upload(make_data(10), config);
  EXPECT_EQ(outcome.state, TransferState::kFailed);
  EXPECT_NE(outcome.error.find("failed to connect"), std::string::npos) << outcome.error;
}

TEST_F(TransferIntegrationTest, StatsCountFinishedTransfers) {
  FERRY_START_SERVER(server::ServerConfig{});

  for (int i = 0; i < 3; ++i) {
    auto outcome = upload(make_data(2000, static_cast<std::uint8_t>(i)), client_config());
    ASSERT_EQ(outcome.state, TransferState::kSuccess) << outcome.error;
    ASSERT_TRUE(wait_for_record(outcome.session_id).has_value());
  }

  auto stats = server_->stats();
  EXPECT_EQ(stats.connections_total, 3u);
  EXPECT_EQ(stats.transfers_succeeded, 3u);
  EXPECT_EQ(stats.connections_active, 0u);
  EXPECT_GT(stats.bytes_sent, 6000u);
  EXPECT_EQ(server_->registry().size(), 3u);
}

}  // namespace ferry::integration_tests
