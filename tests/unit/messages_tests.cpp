#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "transfer/protocol/messages.h"

namespace ferry::tests {

// ====================
// Upload request
// ====================

TEST(MessagesTests, UploadRequestRoundTrip) {
  protocol::UploadRequest request;
  request.file_name = "report.pdf";
  request.file_data = {0x00, 0x01, 0xFE, 0xFF};
  request.chunk_size = 512;

  auto parsed = protocol::parse_upload_request(protocol::encode(request));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->file_name, "report.pdf");
  EXPECT_EQ(parsed->file_data, request.file_data);
  EXPECT_EQ(parsed->chunk_size, std::optional<std::size_t>(512));
  EXPECT_FALSE(parsed->retry_budget.has_value());
}

TEST(MessagesTests, UploadRequestWithEmptyFile) {
  auto parsed = protocol::parse_upload_request(
      R"({"command":"upload","file_name":"empty.bin","file_size":0,"file_data":""})");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_TRUE(parsed->file_data.empty());
}

TEST(MessagesTests, UnknownCommandIsReported) {
  std::string command;
  EXPECT_FALSE(protocol::parse_upload_request(R"({"command":"download","file_name":"x"})", &command)
                   .has_value());
  EXPECT_EQ(command, "download");
}

TEST(MessagesTests, MalformedUploadRequestsAreRejected) {
  std::string command;
  EXPECT_FALSE(protocol::parse_upload_request("not json", &command).has_value());
  EXPECT_FALSE(protocol::parse_upload_request("[1,2,3]", &command).has_value());
  EXPECT_FALSE(protocol::parse_upload_request(R"({"file_name":"a","file_data":"00"})", &command)
                   .has_value());
  // Invalid hex.
  EXPECT_FALSE(protocol::parse_upload_request(
                   R"({"command":"upload","file_name":"a","file_data":"0g"})", &command)
                   .has_value());
  // Declared size disagrees with the payload.
  EXPECT_FALSE(protocol::parse_upload_request(
                   R"({"command":"upload","file_name":"a","file_size":3,"file_data":"0011"})",
                   &command)
                   .has_value());
  // Negative override.
  EXPECT_FALSE(protocol::parse_upload_request(
                   R"({"command":"upload","file_name":"a","file_data":"00","chunk_size":-1})",
                   &command)
                   .has_value());
  EXPECT_TRUE(command.empty());
}

// ====================
// Metadata response
// ====================

TEST(MessagesTests, MetadataRoundTrip) {
  protocol::TransferMetadata metadata;
  metadata.session_id = "127.0.0.1:50000_1700000000_1";
  metadata.checksum = std::string(64, 'a');
  metadata.total_chunks = 10;
  metadata.chunk_size = 1024;
  metadata.file_size = 10240;

  auto parsed = protocol::parse_metadata_response(protocol::encode(metadata));
  ASSERT_TRUE(parsed.has_value());
  const auto* got = std::get_if<protocol::TransferMetadata>(&*parsed);
  ASSERT_NE(got, nullptr);
  EXPECT_EQ(got->session_id, metadata.session_id);
  EXPECT_EQ(got->checksum, metadata.checksum);
  EXPECT_EQ(got->total_chunks, 10u);
  EXPECT_EQ(got->chunk_size, 1024u);
  EXPECT_EQ(got->file_size, 10240u);
}

TEST(MessagesTests, ErrorStatusCarriesMessage) {
  auto parsed =
      protocol::parse_metadata_response(protocol::encode(protocol::ErrorResponse{"Server busy"}));
  ASSERT_TRUE(parsed.has_value());
  const auto* error = std::get_if<protocol::ErrorResponse>(&*parsed);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->message, "Server busy");
}

TEST(MessagesTests, IncompleteMetadataIsRejected) {
  EXPECT_FALSE(protocol::parse_metadata_response(R"({"status":"ready","session_id":"s"})")
                   .has_value());
  EXPECT_FALSE(protocol::parse_metadata_response(R"({"status":"pending"})").has_value());
  EXPECT_FALSE(protocol::parse_metadata_response("READY").has_value());
}

// ====================
// Stream messages
// ====================

TEST(MessagesTests, ChunkMessageRoundTrip) {
  protocol::ChunkMessage chunk;
  chunk.session_id = "s1";
  chunk.sequence = 7;
  chunk.data = {1, 2, 3};
  chunk.chunk_checksum = "00112233445566778899aabbccddeeff";

  auto parsed = protocol::parse_stream_message(protocol::encode(chunk));
  ASSERT_TRUE(parsed.has_value());
  const auto* got = std::get_if<protocol::ChunkMessage>(&*parsed);
  ASSERT_NE(got, nullptr);
  EXPECT_EQ(got->session_id, "s1");
  EXPECT_EQ(got->sequence, 7u);
  EXPECT_EQ(got->data, chunk.data);
  EXPECT_EQ(got->chunk_checksum, chunk.chunk_checksum);
}

TEST(MessagesTests, EndAndAbortAreDistinguished) {
  auto end = protocol::parse_stream_message(protocol::encode(protocol::EndMessage{"done"}));
  ASSERT_TRUE(end.has_value());
  EXPECT_TRUE(std::holds_alternative<protocol::EndMessage>(*end));

  auto abort = protocol::parse_stream_message(protocol::encode(protocol::AbortMessage{"budget"}));
  ASSERT_TRUE(abort.has_value());
  ASSERT_TRUE(std::holds_alternative<protocol::AbortMessage>(*abort));
  EXPECT_EQ(std::get<protocol::AbortMessage>(*abort).message, "budget");
}

TEST(MessagesTests, MalformedStreamFramesAreRejected) {
  EXPECT_FALSE(protocol::parse_stream_message("{").has_value());
  EXPECT_FALSE(protocol::parse_stream_message(R"({"type":"mystery"})").has_value());
  EXPECT_FALSE(protocol::parse_stream_message(
                   R"({"type":"chunk","session_id":"s","sequence":"1","data":"00","chunk_checksum":"x"})")
                   .has_value());
  EXPECT_FALSE(protocol::parse_stream_message(
                   R"({"type":"chunk","session_id":"s","sequence":1,"data":"0","chunk_checksum":"x"})")
                   .has_value());
  EXPECT_FALSE(protocol::parse_stream_message(
                   R"({"type":"chunk","session_id":"s","sequence":1,"data":"00"})")
                   .has_value());
}

// ====================
// Tokens
// ====================

TEST(MessagesTests, ChunkReplyTokens) {
  EXPECT_EQ(protocol::format_chunk_reply(protocol::make_ok_reply()), "OK");
  EXPECT_EQ(protocol::format_chunk_reply(protocol::make_retransmit_reply(42)), "RETRANSMIT:42");
  EXPECT_EQ(protocol::format_chunk_reply(protocol::make_retransmit_last_reply()),
            "RETRANSMIT:LAST");
  EXPECT_EQ(protocol::format_chunk_reply({protocol::ReplyKind::kError, std::nullopt}), "ERROR");
}

TEST(MessagesTests, ChunkReplyParsing) {
  auto ok = protocol::parse_chunk_reply("OK");
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok->kind, protocol::ReplyKind::kOk);

  auto retransmit = protocol::parse_chunk_reply("RETRANSMIT:42");
  ASSERT_TRUE(retransmit.has_value());
  EXPECT_EQ(retransmit->kind, protocol::ReplyKind::kRetransmit);
  EXPECT_EQ(retransmit->sequence, std::optional<std::uint64_t>(42));

  auto last = protocol::parse_chunk_reply("RETRANSMIT:LAST");
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->kind, protocol::ReplyKind::kRetransmit);
  EXPECT_FALSE(last->sequence.has_value());

  auto error = protocol::parse_chunk_reply("ERROR");
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, protocol::ReplyKind::kError);
}

TEST(MessagesTests, InvalidChunkRepliesAreRejected) {
  EXPECT_FALSE(protocol::parse_chunk_reply("").has_value());
  EXPECT_FALSE(protocol::parse_chunk_reply("ok").has_value());
  EXPECT_FALSE(protocol::parse_chunk_reply("RETRANSMIT:").has_value());
  EXPECT_FALSE(protocol::parse_chunk_reply("RETRANSMIT:-1").has_value());
  EXPECT_FALSE(protocol::parse_chunk_reply("RETRANSMIT:12a").has_value());
  EXPECT_FALSE(protocol::parse_chunk_reply("RETRANSMIT 3").has_value());
}

TEST(MessagesTests, VerdictTokens) {
  EXPECT_EQ(protocol::to_token(protocol::Verdict::kSuccess), "SUCCESS");
  EXPECT_EQ(protocol::to_token(protocol::Verdict::kChecksumMismatch), "CHECKSUM_MISMATCH");
  EXPECT_EQ(protocol::to_token(protocol::Verdict::kError), "ERROR");

  EXPECT_EQ(protocol::parse_verdict("CHECKSUM_MISMATCH"),
            std::optional<protocol::Verdict>(protocol::Verdict::kChecksumMismatch));
  EXPECT_FALSE(protocol::parse_verdict("OK").has_value());
}

}  // namespace ferry::tests
