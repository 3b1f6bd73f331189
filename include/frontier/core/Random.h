#pragma once

#include "frontier/core/Types.h"

#include <algorithm>
#include <string_view>
#include <utility>

namespace frontier::core {

// SplitMix64 stream. Each consumer (event rolls, leg distances) owns one,
// seeded from the run seed, so a journey replays exactly from its seed.
class SplitMix64 {
public:
  SplitMix64() = default;
  explicit SplitMix64(u64 seed) : m_state(seed) {}

  u64 nextU64() {
    u64 z = (m_state += 0x9E3779B97F4A7C15ull);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
    return z ^ (z >> 31);
  }

  // [0, 1) from the top 53 bits.
  double nextDouble01() {
    return static_cast<double>(nextU64() >> 11) * 0x1.0p-53;
  }

  // Uniform in [lo, hi]; the bounds may come in either order.
  int between(int lo, int hi) {
    if (hi < lo) std::swap(lo, hi);
    const u64 span = static_cast<u64>(static_cast<i64>(hi) - static_cast<i64>(lo)) + 1ull;

    // Reject the tail so every value is equally likely.
    const u64 limit = ~0ull - (~0ull % span);
    u64 r = nextU64();
    while (r >= limit) r = nextU64();
    return static_cast<int>(static_cast<i64>(lo) + static_cast<i64>(r % span));
  }

  // True with the given probability, clamped to [0, 1].
  bool chance(double probability) {
    return nextDouble01() < std::clamp(probability, 0.0, 1.0);
  }

private:
  u64 m_state{0};
};

// Seed from free text, e.g. `--seed donner`. FNV-1a over the bytes.
inline u64 seedFromString(std::string_view text) {
  u64 h = 14695981039346656037ull;
  for (const char c : text) {
    h ^= static_cast<unsigned char>(c);
    h *= 1099511628211ull;
  }
  return h;
}

// Seed for one named stream of a run ("events", "distance").
inline u64 deriveSeed(u64 runSeed, std::string_view stream) {
  const u64 tag = seedFromString(stream);
  return runSeed ^ (tag + 0x9E3779B97F4A7C15ull + (runSeed << 6) + (runSeed >> 2));
}

} // namespace frontier::core
