#pragma once

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>

namespace cmsketch::cli::util {

inline auto parse_u64(std::string_view s, std::uint64_t& out) noexcept -> bool {
  if (s.empty()) {
    return false;
  }
  std::uint64_t value = 0;
  for (char ch_raw : s) {
    const auto ch = static_cast<unsigned char>(ch_raw);
    if (ch < '0' || ch > '9') {
      return false;
    }
    const auto digit = static_cast<std::uint64_t>(ch - '0');
    if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10ULL) {
      return false; // overflow
    }
    value = (value * 10ULL) + digit;
  }
  out = value;
  return true;
}

// Signed variant so that "--width=-4" reaches sketch::make and is rejected there.
inline auto parse_i64(std::string_view s, std::int64_t& out) noexcept -> bool {
  const bool negative = !s.empty() && s.front() == '-';
  if (negative) {
    s.remove_prefix(1);
  }
  std::uint64_t mag = 0;
  if (!parse_u64(s, mag) || mag > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    return false;
  }
  out = negative ? -static_cast<std::int64_t>(mag) : static_cast<std::int64_t>(mag);
  return true;
}

inline auto parse_double(std::string_view s, double& out) -> bool {
  char* end = nullptr;
  std::string tmp{s};
  const double v = std::strtod(tmp.c_str(), &end);
  if (end == tmp.c_str() || *end != '\0') {
    return false;
  }
  out = v;
  return true;
}

} // namespace cmsketch::cli::util
