#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <sodium.h>

namespace ferry::crypto {

// Per-chunk digest: BLAKE2b truncated to 128 bits.
inline constexpr std::size_t kChunkDigestLen = 16;
// Whole-file digest: SHA-256.
inline constexpr std::size_t kFileDigestLen = 32;

using ChunkDigest = std::array<std::uint8_t, kChunkDigestLen>;
using FileDigest = std::array<std::uint8_t, kFileDigestLen>;

// Throws std::runtime_error if libsodium cannot be initialized.
void ensure_sodium_ready();

ChunkDigest digest_chunk(std::span<const std::uint8_t> payload);
FileDigest digest_whole(std::span<const std::uint8_t> data);

// Incremental SHA-256 for data that arrives in pieces (reassembled chunks).
class FileDigestBuilder {
 public:
  FileDigestBuilder();

  void update(std::span<const std::uint8_t> data);
  FileDigest finalize();

 private:
  crypto_hash_sha256_state state_{};
  bool finalized_{false};
};

// Lower-case hex, two characters per byte.
std::string to_hex(std::span<const std::uint8_t> data);

// Returns nullopt on odd length or any non-hex character.
std::optional<std::vector<std::uint8_t>> from_hex(std::string_view hex);

// Constant-time comparison of two digests given as hex strings. Case-insensitive.
bool hex_digest_equal(std::string_view a, std::string_view b);

}  // namespace ferry::crypto
