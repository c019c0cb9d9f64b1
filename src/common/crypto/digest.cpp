#include "common/crypto/digest.h"

#include <cctype>
#include <stdexcept>

namespace ferry::crypto {

void ensure_sodium_ready() {
  static const bool ready = [] { return sodium_init() >= 0; }();
  if (!ready) {
    throw std::runtime_error("libsodium initialization failed");
  }
}

ChunkDigest digest_chunk(std::span<const std::uint8_t> payload) {
  ensure_sodium_ready();
  ChunkDigest out{};
  crypto_generichash(out.data(), out.size(), payload.data(), payload.size(), nullptr, 0);
  return out;
}

FileDigest digest_whole(std::span<const std::uint8_t> data) {
  ensure_sodium_ready();
  FileDigest out{};
  crypto_hash_sha256(out.data(), data.data(), data.size());
  return out;
}

FileDigestBuilder::FileDigestBuilder() {
  ensure_sodium_ready();
  crypto_hash_sha256_init(&state_);
}

void FileDigestBuilder::update(std::span<const std::uint8_t> data) {
  if (finalized_) {
    throw std::logic_error("FileDigestBuilder::update after finalize");
  }
  crypto_hash_sha256_update(&state_, data.data(), data.size());
}

FileDigest FileDigestBuilder::finalize() {
  if (finalized_) {
    throw std::logic_error("FileDigestBuilder::finalize called twice");
  }
  FileDigest out{};
  crypto_hash_sha256_final(&state_, out.data());
  finalized_ = true;
  return out;
}

std::string to_hex(std::span<const std::uint8_t> data) {
  ensure_sodium_ready();
  if (data.empty()) {
    return {};
  }
  // sodium_bin2hex writes a terminating NUL.
  std::string out(data.size() * 2 + 1, '\0');
  sodium_bin2hex(out.data(), out.size(), data.data(), data.size());
  out.pop_back();
  return out;
}

std::optional<std::vector<std::uint8_t>> from_hex(std::string_view hex) {
  ensure_sodium_ready();
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }
  if (hex.empty()) {
    return std::vector<std::uint8_t>{};
  }
  std::vector<std::uint8_t> out(hex.size() / 2);
  std::size_t written = 0;
  const char* end = nullptr;
  if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &written, &end) != 0) {
    return std::nullopt;
  }
  // Without an ignore set, parsing stops at the first non-hex character.
  if (written != out.size() || end != hex.data() + hex.size()) {
    return std::nullopt;
  }
  return out;
}

bool hex_digest_equal(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  unsigned char diff = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(a[i])) ^
                                       std::tolower(static_cast<unsigned char>(b[i])));
  }
  return diff == 0;
}

}  // namespace ferry::crypto
