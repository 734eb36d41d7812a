#pragma once

#include <string_view>

namespace cmsketch::cli::util {

constexpr auto sv_starts_with(std::string_view s, std::string_view prefix) noexcept -> bool {
#if defined(__cpp_lib_starts_ends_with) && (__cpp_lib_starts_ends_with >= 201711L)
  return s.starts_with(prefix);
#else
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
#endif
}

// "--out=path" with prefix "--out=" yields "path"
constexpr auto option_value(std::string_view arg, std::string_view prefix, std::string_view& value) noexcept
    -> bool {
  if (!sv_starts_with(arg, prefix)) {
    return false;
  }
  value = arg.substr(prefix.size());
  return true;
}

} // namespace cmsketch::cli::util
