#include "cmsketch/diagnostics.hpp"
#include <array>
#include <cstdio>

namespace cmsketch {

auto describe(const diagnostic& d) -> std::string {
  std::array<char, 192> buf{};
  int n = 0;
  switch (d.kind) {
  case event_kind::width_adjusted:
    n = std::snprintf(buf.data(), buf.size(), "adjusted sketch width from %llu to next power of 2: %llu",
                      static_cast<unsigned long long>(d.requested_width), static_cast<unsigned long long>(d.width));
    break;
  case event_kind::dimensions_estimated:
    n = std::snprintf(buf.data(), buf.size(),
                      "estimated width=%llu (adjusted to %llu), depth=%llu for epsilon=%g, delta=%g",
                      static_cast<unsigned long long>(d.requested_width), static_cast<unsigned long long>(d.width),
                      static_cast<unsigned long long>(d.depth), d.eps, d.delta);
    break;
  }
  if (n <= 0) {
    return std::string{"unknown diagnostic"};
  }
  return std::string{buf.data()};
}

auto stderr_sink() -> diagnostic_sink {
  return [](const diagnostic& d) -> void {
    const std::string line = describe(d);
    std::fprintf(stderr, "cmsketch: %s\n", line.c_str());
  };
}

} // namespace cmsketch
