#include <gtest/gtest.h>

#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

#include "common/crypto/digest.h"
#include "transfer/chunking/reassembly_buffer.h"
#include "transfer/chunking/splitter.h"

namespace ferry::tests {

namespace {
std::vector<std::uint8_t> make_data(std::size_t size) {
  std::vector<std::uint8_t> data(size);
  for (std::size_t i = 0; i < size; ++i) {
    data[i] = static_cast<std::uint8_t>((i * 13) & 0xFF);
  }
  return data;
}

protocol::ChunkMessage to_message(const chunking::Chunk& chunk) {
  protocol::ChunkMessage msg;
  msg.session_id = "test";
  msg.sequence = chunk.sequence;
  msg.data = chunk.payload;
  msg.chunk_checksum = crypto::to_hex(chunk.digest);
  return msg;
}
}  // namespace

// ====================
// ReassemblyBuffer
// ====================

TEST(ReassemblyBufferTests, FirstCopyWins) {
  chunking::ReassemblyBuffer buffer(2);
  EXPECT_TRUE(buffer.insert(0, {1, 2, 3}));
  EXPECT_FALSE(buffer.insert(0, {9, 9, 9}));
  EXPECT_TRUE(buffer.insert(1, {4}));

  auto assembled = buffer.assemble();
  ASSERT_TRUE(assembled.has_value());
  EXPECT_EQ(*assembled, (std::vector<std::uint8_t>{1, 2, 3, 4}));
  EXPECT_EQ(buffer.memory_usage(), 4u);
}

TEST(ReassemblyBufferTests, OutOfRangeSequenceIsRefused) {
  chunking::ReassemblyBuffer buffer(2);
  EXPECT_FALSE(buffer.insert(2, {1}));
  EXPECT_EQ(buffer.size(), 0u);
}

TEST(ReassemblyBufferTests, IncompleteBufferDoesNotAssemble) {
  chunking::ReassemblyBuffer buffer(3);
  ASSERT_TRUE(buffer.insert(2, {3}));
  ASSERT_TRUE(buffer.insert(0, {1}));
  EXPECT_FALSE(buffer.is_complete());
  EXPECT_FALSE(buffer.assemble().has_value());
  EXPECT_FALSE(buffer.digest().has_value());
  EXPECT_EQ(buffer.missing(), (std::vector<std::uint64_t>{1}));
}

TEST(ReassemblyBufferTests, OutOfOrderArrivalAssemblesInSequenceOrder) {
  const auto data = make_data(5000);
  auto chunks = chunking::split(data, 700);
  chunking::ReassemblyBuffer buffer(chunks.size());
  for (auto it = chunks.rbegin(); it != chunks.rend(); ++it) {
    ASSERT_TRUE(buffer.insert(it->sequence, it->payload));
  }
  ASSERT_TRUE(buffer.is_complete());
  EXPECT_EQ(buffer.assemble().value(), data);
  EXPECT_EQ(buffer.digest().value(), crypto::digest_whole(data));
}

TEST(ReassemblyBufferTests, ZeroChunksIsImmediatelyComplete) {
  chunking::ReassemblyBuffer buffer(0);
  EXPECT_TRUE(buffer.is_complete());
  EXPECT_TRUE(buffer.assemble().value().empty());
  EXPECT_EQ(buffer.digest().value(), crypto::digest_whole(std::vector<std::uint8_t>{}));
}

// ====================
// Reassembler
// ====================

TEST(ReassemblerTests, VerifiedChunkIsAccepted) {
  const auto chunks = chunking::split(make_data(100), 64);
  chunking::Reassembler reassembler(chunks.size());

  const auto decision = reassembler.on_chunk(to_message(chunks[1]));
  EXPECT_EQ(decision.action, chunking::ChunkAction::kAccept);
  EXPECT_EQ(decision.sequence, 1u);
  EXPECT_FALSE(decision.duplicate);
  EXPECT_TRUE(reassembler.buffer().contains(1));
  EXPECT_EQ(reassembler.stats().chunks_accepted, 1u);
}

TEST(ReassemblerTests, CorruptedChunkRequestsRetransmission) {
  const auto chunks = chunking::split(make_data(100), 64);
  chunking::Reassembler reassembler(chunks.size());

  auto msg = to_message(chunks[0]);
  msg.data[10] ^= 0x40;
  const auto decision = reassembler.on_chunk(msg);
  EXPECT_EQ(decision.action, chunking::ChunkAction::kRequestRetransmit);
  EXPECT_EQ(decision.sequence, 0u);
  EXPECT_FALSE(reassembler.buffer().contains(0));
  EXPECT_EQ(reassembler.stats().digest_mismatches, 1u);
}

TEST(ReassemblerTests, UpperCaseChecksumIsAccepted) {
  const auto chunks = chunking::split(make_data(10), 64);
  chunking::Reassembler reassembler(chunks.size());

  auto msg = to_message(chunks[0]);
  for (auto& c : msg.chunk_checksum) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  EXPECT_EQ(reassembler.on_chunk(msg).action, chunking::ChunkAction::kAccept);
}

TEST(ReassemblerTests, DuplicateIsIdempotent) {
  const auto data = make_data(200);
  const auto chunks = chunking::split(data, 64);
  chunking::Reassembler reassembler(chunks.size());

  ASSERT_EQ(reassembler.on_chunk(to_message(chunks[2])).action, chunking::ChunkAction::kAccept);
  const auto usage = reassembler.buffer().memory_usage();

  const auto again = reassembler.on_chunk(to_message(chunks[2]));
  EXPECT_EQ(again.action, chunking::ChunkAction::kAccept);
  EXPECT_TRUE(again.duplicate);
  EXPECT_EQ(reassembler.buffer().size(), 1u);
  EXPECT_EQ(reassembler.buffer().memory_usage(), usage);
  EXPECT_EQ(reassembler.stats().duplicates, 1u);
  EXPECT_EQ(reassembler.stats().chunks_accepted, 1u);
}

TEST(ReassemblerTests, OutOfRangeSequenceIsNotStored) {
  const auto chunks = chunking::split(make_data(64), 64);
  chunking::Reassembler reassembler(chunks.size());

  auto msg = to_message(chunks[0]);
  msg.sequence = 5;
  EXPECT_EQ(reassembler.on_chunk(msg).action, chunking::ChunkAction::kRequestRetransmit);
  EXPECT_EQ(reassembler.buffer().size(), 0u);
}

TEST(ReassemblerTests, CompletesWhenEverySequenceIsVerified) {
  const auto data = make_data(1000);
  const auto chunks = chunking::split(data, 128);
  chunking::Reassembler reassembler(chunks.size());

  for (std::size_t i = 0; i < chunks.size(); i += 2) {
    ASSERT_EQ(reassembler.on_chunk(to_message(chunks[i])).action, chunking::ChunkAction::kAccept);
  }
  EXPECT_FALSE(reassembler.is_complete());
  for (std::size_t i = 1; i < chunks.size(); i += 2) {
    ASSERT_EQ(reassembler.on_chunk(to_message(chunks[i])).action, chunking::ChunkAction::kAccept);
  }
  ASSERT_TRUE(reassembler.is_complete());
  EXPECT_EQ(reassembler.buffer().assemble().value(), data);
}

}  // namespace ferry::tests
