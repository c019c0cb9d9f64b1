#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "common/crypto/digest.h"

namespace ferry::chunking {

struct Chunk {
  std::uint64_t sequence{0};
  std::vector<std::uint8_t> payload;
  crypto::ChunkDigest digest{};
};

// Number of chunks split() produces for a buffer of data_size bytes.
std::uint64_t chunk_count(std::size_t data_size, std::size_t chunk_size);

// Partition data into consecutive chunk_size slices; only the last may be
// shorter and none is empty. Empty data yields no chunks.
// Throws std::invalid_argument if chunk_size is zero.
std::vector<Chunk> split(std::span<const std::uint8_t> data, std::size_t chunk_size);

}  // namespace ferry::chunking
