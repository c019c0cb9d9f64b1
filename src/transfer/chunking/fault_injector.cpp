#include "transfer/chunking/fault_injector.h"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace ferry::chunking {

namespace {
std::uint64_t seed_from(const FaultPolicy& policy) {
  if (policy.seed) {
    return *policy.seed;
  }
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}
}  // namespace

const char* to_string(FaultAction action) {
  switch (action) {
    case FaultAction::kPass:
      return "pass";
    case FaultAction::kDrop:
      return "drop";
    case FaultAction::kCorrupt:
      return "corrupt";
  }
  return "unknown";
}

FaultInjector::FaultInjector(FaultPolicy policy) : policy_(policy) {
  if (!(policy_.rate >= 0.0 && policy_.rate <= 1.0)) {
    throw std::invalid_argument("fault rate must be within [0, 1]");
  }
  // Only a live policy pays for seeding.
  if (enabled()) {
    rng_.seed(seed_from(policy_));
  }
}

FaultOutcome FaultInjector::perturb(const Chunk& chunk) {
  if (!enabled()) {
    return {};
  }

  std::uniform_real_distribution<double> draw(0.0, 1.0);
  if (draw(rng_) >= policy_.rate) {
    return {};
  }

  std::bernoulli_distribution drop_or_corrupt(0.5);
  if (drop_or_corrupt(rng_) || chunk.payload.empty()) {
    return FaultOutcome{FaultAction::kDrop, std::nullopt};
  }
  return FaultOutcome{FaultAction::kCorrupt, corrupt(chunk)};
}

Chunk FaultInjector::corrupt(const Chunk& chunk) {
  Chunk damaged = chunk;
  auto& payload = damaged.payload;

  // Distinct positions so two flips never cancel out.
  const std::size_t limit = std::min(kMaxCorruptedBytes, payload.size());
  std::uniform_int_distribution<std::size_t> how_many(1, limit);
  std::uniform_int_distribution<std::size_t> where(0, payload.size() - 1);
  const std::size_t count = how_many(rng_);
  std::vector<std::size_t> positions;
  positions.reserve(count);
  while (positions.size() < count) {
    const std::size_t pos = where(rng_);
    if (std::find(positions.begin(), positions.end(), pos) == positions.end()) {
      positions.push_back(pos);
    }
  }

  std::uniform_int_distribution<int> mask(1, 255);
  for (std::size_t pos : positions) {
    payload[pos] ^= static_cast<std::uint8_t>(mask(rng_));
  }
  return damaged;
}

}  // namespace ferry::chunking
