#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace cmsketch {

enum class event_kind : std::uint8_t { width_adjusted, dimensions_estimated };

// Structured notice emitted while sizing a sketch. Fields not meaningful for
// the event kind stay zero.
struct diagnostic {
  event_kind kind{event_kind::width_adjusted};
  std::uint64_t requested_width{}; // width_adjusted: caller's width; dimensions_estimated: ceil(e/eps)
  std::uint64_t width{};
  std::uint64_t depth{};
  double eps{};
  double delta{};
};

using diagnostic_sink = std::function<void(const diagnostic&)>;

[[nodiscard]] auto describe(const diagnostic& d) -> std::string;

// Sink that logs describe(d) to stderr.
[[nodiscard]] auto stderr_sink() -> diagnostic_sink;

} // namespace cmsketch
