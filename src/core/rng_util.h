// Random number generation utilities for deterministic embedding and clustering.

#ifndef MOODSPACE_CORE_RNG_UTIL_H
#define MOODSPACE_CORE_RNG_UTIL_H

#include <cstddef>
#include <cstdint>
#include <numeric>
#include <random>
#include <vector>

namespace moodspace {
namespace rng {

/// @brief Generate a random double in [0, 1).
/// @param rng Mersenne Twister RNG instance.
inline double rollUnit(std::mt19937& rng) {
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(rng);
}

/// @brief Generate a random index in [0, count - 1].
/// @param rng Mersenne Twister RNG instance.
/// @param count Number of choices (must be > 0).
inline size_t rollIndex(std::mt19937& rng, size_t count) {
  std::uniform_int_distribution<size_t> dist(0, count - 1);
  return dist(rng);
}

/// @brief Select an index using non-negative weights.
///
/// Falls back to a uniform pick when every weight is zero.
///
/// @param rng Mersenne Twister RNG instance.
/// @param weights Non-empty weight vector (all >= 0).
/// @return Selected index.
inline size_t selectWeightedIndex(std::mt19937& rng, const std::vector<double>& weights) {
  double total = std::accumulate(weights.begin(), weights.end(), 0.0);
  if (total <= 0.0) return rollIndex(rng, weights.size());
  double roll = rollUnit(rng) * total;
  double cumulative = 0.0;
  for (size_t idx = 0; idx < weights.size(); ++idx) {
    cumulative += weights[idx];
    if (roll < cumulative) return idx;
  }
  return weights.size() - 1;
}

/// @brief Splitmix32 hash for decorrelating per-run sub-seeds.
///
/// Use this instead of `seed + run * constant` so that k-means restarts and
/// embedding sub-steps draw from well separated streams.
///
/// @param seed Base seed value.
/// @param index Sub-seed index.
/// @return Decorrelated 32-bit hash.
inline uint32_t splitmix32(uint32_t seed, uint32_t index) {
  uint32_t z = seed + index * 0x9E3779B9u;
  z = (z ^ (z >> 16)) * 0x85EBCA6Bu;
  z = (z ^ (z >> 13)) * 0xC2B2AE35u;
  return z ^ (z >> 16);
}

}  // namespace rng
}  // namespace moodspace

#endif  // MOODSPACE_CORE_RNG_UTIL_H
