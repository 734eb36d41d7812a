#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "nlohmann/json_fwd.hpp"

#include "cmsketch/diagnostics.hpp"
#include "cmsketch/expected.hpp"

namespace cmsketch {

struct Config {
  double eps = 1e-3;
  double delta = 1e-2;
};

struct dimensions {
  std::size_t width{};     // power of two
  std::size_t depth{};
  std::size_t raw_width{}; // ceil(e / eps) before rounding
};

// Largest width a 32-bit row hash can address.
inline constexpr std::size_t kMaxWidth = std::size_t{1} << 31U;

[[nodiscard]] auto next_pow2(std::uint64_t n) noexcept -> std::uint64_t;
// width = next_pow2(ceil(e / eps)), depth = max(1, ceil(ln(1 / delta)))
[[nodiscard]] auto compute_dims(double eps, double delta) -> result<dimensions>;

// Count-Min sketch with 32-bit wrapping counters.
//
// query() may be called concurrently on one instance. update(), merge() and
// clear() write the table and must be serialized against every other call.
class sketch {
public:
  sketch() = default;
  // A moved-from sketch is left empty (width and depth 0).
  sketch(sketch&& other) noexcept
      : width_(std::exchange(other.width_, 0U)), depth_(std::exchange(other.depth_, 0U)),
        mask_(std::exchange(other.mask_, 0U)), table_(std::exchange(other.table_, {})),
        seeds_(std::exchange(other.seeds_, {})) {}
  auto operator=(sketch&& other) noexcept -> sketch& {
    if (this != &other) {
      width_ = std::exchange(other.width_, 0U);
      depth_ = std::exchange(other.depth_, 0U);
      mask_ = std::exchange(other.mask_, 0U);
      table_ = std::exchange(other.table_, {});
      seeds_ = std::exchange(other.seeds_, {});
    }
    return *this;
  }
  sketch(const sketch&) = delete;
  auto operator=(const sketch&) -> sketch& = delete;

  // width is rounded up to the next power of two; sink hears about the adjustment
  [[nodiscard]] static auto make(std::int64_t width, std::int64_t depth, const diagnostic_sink& sink = {})
      -> result<sketch>;
  [[nodiscard]] static auto make_by_eps_delta(double eps, double delta, const diagnostic_sink& sink = {})
      -> result<sketch>;
  [[nodiscard]] static auto make(const Config& cfg, const diagnostic_sink& sink = {}) -> result<sketch> {
    return make_by_eps_delta(cfg.eps, cfg.delta, sink);
  }

  // Non-positive counts are ignored. Counts wrap modulo 2^32.
  void update(std::string_view key, std::int64_t count = 1) noexcept;
  [[nodiscard]] auto query(std::string_view key) const noexcept -> std::uint32_t;
  // Requires identical width and depth; other is left untouched
  [[nodiscard]] auto merge(const sketch& other) -> result<void>;
  void clear() noexcept;

  [[nodiscard]] auto serialize() const -> nlohmann::json;
  [[nodiscard]] static auto deserialize(const nlohmann::json& data, const diagnostic_sink& sink = {})
      -> result<sketch>;

  [[nodiscard]] auto clone() const -> sketch {
    return sketch{width_, depth_, std::vector<std::uint32_t>(table_), std::vector<std::uint32_t>(seeds_)};
  }

  [[nodiscard]] auto width() const noexcept -> std::size_t {
    return width_;
  }
  [[nodiscard]] auto depth() const noexcept -> std::size_t {
    return depth_;
  }
  [[nodiscard]] auto table() const noexcept -> std::span<const std::uint32_t> {
    return table_;
  }
  [[nodiscard]] auto seeds() const noexcept -> std::span<const std::uint32_t> {
    return seeds_;
  }
  [[nodiscard]] auto same_params(const sketch& other) const noexcept -> bool {
    return width_ == other.width_ && depth_ == other.depth_;
  }

private:
  static constexpr std::size_t kUnrolledDepth = 5;
  static constexpr std::size_t kHashBlock = 32; // rows hashed per stack buffer fill

  explicit sketch(std::size_t w, std::size_t d, std::vector<std::uint32_t>&& counters,
                  std::vector<std::uint32_t>&& seeds) noexcept
      : width_(w), depth_(d), mask_(static_cast<std::uint32_t>(w - 1U)), table_(std::move(counters)),
        seeds_(std::move(seeds)) {}

  void update_unrolled(std::string_view key, std::uint32_t c) noexcept;
  void update_generic(std::string_view key, std::uint32_t c) noexcept;
  [[nodiscard]] auto query_unrolled(std::string_view key) const noexcept -> std::uint32_t;
  [[nodiscard]] auto query_generic(std::string_view key) const noexcept -> std::uint32_t;

  std::size_t width_{};
  std::size_t depth_{};
  std::uint32_t mask_{};
  std::vector<std::uint32_t> table_; // size depth_*width_, row-major
  std::vector<std::uint32_t> seeds_;
};

} // namespace cmsketch
