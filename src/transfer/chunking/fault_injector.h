#pragma once

#include <cstdint>
#include <optional>
#include <random>

#include "transfer/chunking/splitter.h"

namespace ferry::chunking {

// Simulated unreliable channel applied by the sender before each first
// transmission of a chunk. Retransmissions bypass it.
struct FaultPolicy {
  bool enabled{false};
  // Probability in [0, 1] that a chunk is faulted at all.
  double rate{0.0};
  // Fixed seed for reproducible runs; random_device otherwise.
  std::optional<std::uint64_t> seed;
};

enum class FaultAction { kPass, kDrop, kCorrupt };

const char* to_string(FaultAction action);

struct FaultOutcome {
  FaultAction action{FaultAction::kPass};
  // Set for kCorrupt: a copy of the chunk whose payload no longer matches its digest.
  std::optional<Chunk> corrupted;
};

class FaultInjector {
 public:
  // Upper bound of bytes altered in a corrupted payload.
  static constexpr std::size_t kMaxCorruptedBytes = 10;

  // Throws std::invalid_argument if the rate is outside [0, 1].
  explicit FaultInjector(FaultPolicy policy = {});

  FaultOutcome perturb(const Chunk& chunk);

  [[nodiscard]] bool enabled() const noexcept { return policy_.enabled && policy_.rate > 0.0; }
  [[nodiscard]] const FaultPolicy& policy() const noexcept { return policy_; }

 private:
  Chunk corrupt(const Chunk& chunk);

  FaultPolicy policy_;
  std::mt19937_64 rng_;
};

}  // namespace ferry::chunking
