#include "cmsketch/hash.hpp"
#include <algorithm>
#include <numeric>

namespace cmsketch::hashing {

auto make_seeds(std::size_t depth) -> std::vector<std::uint32_t> {
  std::vector<std::uint32_t> seeds(depth);
  std::iota(seeds.begin(), seeds.end(), 0U);
  return seeds;
}

void populate_hashes(std::string_view key, std::span<const std::uint32_t> seeds,
                     std::span<std::uint32_t> out) noexcept {
  const std::size_t n = std::min(seeds.size(), out.size());
  for (std::size_t i = 0; i < n; ++i) {
    out[i] = fnv1a32(key, seeds[i]);
  }
}

} // namespace cmsketch::hashing
