#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace cmsketch::hashing {

inline constexpr std::uint32_t kFnvOffsetBasis = 2166136261U;
inline constexpr std::uint32_t kFnvPrime = 16777619U;

// 32-bit FNV-1a over the bytes of `key`, with `seed` folded into the offset basis.
[[nodiscard]] constexpr auto fnv1a32(std::string_view key, std::uint32_t seed = 0) noexcept -> std::uint32_t {
  std::uint32_t h = kFnvOffsetBasis ^ seed;
  for (const char ch : key) {
    h ^= static_cast<std::uint32_t>(static_cast<unsigned char>(ch));
    h *= kFnvPrime;
  }
  return h;
}

// Row seeds 0..depth-1. Rows differ only by the value xor-ed into the offset basis.
[[nodiscard]] auto make_seeds(std::size_t depth) -> std::vector<std::uint32_t>;

// Writes fnv1a32(key, seeds[i]) to out[i] for i < min(seeds.size(), out.size()).
void populate_hashes(std::string_view key, std::span<const std::uint32_t> seeds,
                     std::span<std::uint32_t> out) noexcept;

} // namespace cmsketch::hashing
