#include "transfer/chunking/splitter.h"

#include <algorithm>
#include <stdexcept>

namespace ferry::chunking {

std::uint64_t chunk_count(std::size_t data_size, std::size_t chunk_size) {
  if (chunk_size == 0) {
    throw std::invalid_argument("chunk size must be positive");
  }
  return (data_size + chunk_size - 1) / chunk_size;
}

std::vector<Chunk> split(std::span<const std::uint8_t> data, std::size_t chunk_size) {
  const auto count = chunk_count(data.size(), chunk_size);

  std::vector<Chunk> chunks;
  chunks.reserve(static_cast<std::size_t>(count));
  for (std::uint64_t seq = 0; seq < count; ++seq) {
    const std::size_t offset = static_cast<std::size_t>(seq) * chunk_size;
    const std::size_t length = std::min(chunk_size, data.size() - offset);
    auto slice = data.subspan(offset, length);

    Chunk chunk;
    chunk.sequence = seq;
    chunk.payload.assign(slice.begin(), slice.end());
    chunk.digest = crypto::digest_chunk(slice);
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

}  // namespace ferry::chunking
