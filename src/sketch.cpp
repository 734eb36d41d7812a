#include "cmsketch/sketch.hpp"
#include "cmsketch/error.hpp"
#include "cmsketch/hash.hpp"
#include <algorithm>
#include <array>
#include <bit>
#include <cmath>
#include <limits>
#include <string>

using cmsketch::errc;
using cmsketch::make_error;
using cmsketch::result;
using cmsketch::hashing::populate_hashes;

namespace cmsketch {

namespace {
constexpr std::size_t kMaxDepth = 1U << 16U;

inline auto notify(const diagnostic_sink& sink, const diagnostic& d) -> void {
  if (sink) {
    sink(d);
  }
}
} // namespace

auto next_pow2(std::uint64_t n) noexcept -> std::uint64_t {
  if (n <= 1U) {
    return 1U;
  }
  return std::bit_ceil(n);
}

auto compute_dims(double eps, double delta) -> result<dimensions> {
  if (!(eps > 0.0) || !(eps < 1.0) || !(delta > 0.0) || !(delta < 1.0)) {
    return result<dimensions>::from_error(make_error(errc::invalid_parameter, "eps/delta out of range"));
  }
  const double w_d = std::ceil(std::exp(1.0) / eps);
  const double d_d = std::ceil(std::log(1.0 / delta));
  if (w_d > static_cast<double>(kMaxWidth)) {
    return result<dimensions>::from_error(make_error(errc::invalid_parameter, "eps too small for a 32-bit hash"));
  }
  if (!(d_d <= static_cast<double>(kMaxDepth))) {
    return result<dimensions>::from_error(make_error(errc::invalid_parameter, "delta too small"));
  }
  const auto raw = static_cast<std::size_t>(w_d);
  const auto d = std::max<std::size_t>(1U, static_cast<std::size_t>(d_d));
  return dimensions{.width = static_cast<std::size_t>(next_pow2(raw)), .depth = d, .raw_width = raw};
}

auto sketch::make(std::int64_t width, std::int64_t depth, const diagnostic_sink& sink) -> result<sketch> {
  if (width <= 0 || depth <= 0) {
    return result<sketch>::from_error(make_error(errc::invalid_dimension));
  }
  const std::uint64_t w = next_pow2(static_cast<std::uint64_t>(width));
  if (w > kMaxWidth) {
    return result<sketch>::from_error(make_error(errc::invalid_dimension, "width exceeds 2^31"));
  }
  const auto d = static_cast<std::uint64_t>(depth);
  if (d > std::vector<std::uint32_t>{}.max_size() / w) {
    return result<sketch>::from_error(make_error(errc::invalid_dimension, "table too large"));
  }
  if (w != static_cast<std::uint64_t>(width)) {
    notify(sink, diagnostic{.kind = event_kind::width_adjusted,
                            .requested_width = static_cast<std::uint64_t>(width),
                            .width = w,
                            .depth = d});
  }
  const auto ws = static_cast<std::size_t>(w);
  const auto ds = static_cast<std::size_t>(d);
  std::vector<std::uint32_t> counters(ws * ds, 0U);
  return sketch{ws, ds, std::move(counters), hashing::make_seeds(ds)};
}

auto sketch::make_by_eps_delta(double eps, double delta, const diagnostic_sink& sink) -> result<sketch> {
  auto dims = compute_dims(eps, delta);
  if (!dims) {
    return result<sketch>::from_error(std::move(dims).error());
  }
  const dimensions& dm = dims.value();
  notify(sink, diagnostic{.kind = event_kind::dimensions_estimated,
                          .requested_width = dm.raw_width,
                          .width = dm.width,
                          .depth = dm.depth,
                          .eps = eps,
                          .delta = delta});
  // already a power of two, so make() has nothing to report
  return make(static_cast<std::int64_t>(dm.width), static_cast<std::int64_t>(dm.depth), sink);
}

void sketch::update(std::string_view key, std::int64_t count) noexcept {
  if (count <= 0) {
    return;
  }
  const auto c = static_cast<std::uint32_t>(count);
  if (depth_ == kUnrolledDepth) {
    update_unrolled(key, c);
  } else {
    update_generic(key, c);
  }
}

auto sketch::query(std::string_view key) const noexcept -> std::uint32_t {
  if (depth_ == kUnrolledDepth) {
    return query_unrolled(key);
  }
  return query_generic(key);
}

void sketch::update_unrolled(std::string_view key, std::uint32_t c) noexcept {
  std::array<std::uint32_t, kUnrolledDepth> h{};
  populate_hashes(key, seeds_, h);
  const std::size_t w = width_;
  table_[(h[0] & mask_)] += c;
  table_[(h[1] & mask_) + w] += c;
  table_[(h[2] & mask_) + (2 * w)] += c;
  table_[(h[3] & mask_) + (3 * w)] += c;
  table_[(h[4] & mask_) + (4 * w)] += c;
}

void sketch::update_generic(std::string_view key, std::uint32_t c) noexcept {
  std::array<std::uint32_t, kHashBlock> h{};
  const std::span<const std::uint32_t> seeds{seeds_};
  for (std::size_t base = 0; base < depth_; base += kHashBlock) {
    const std::size_t n = std::min(kHashBlock, depth_ - base);
    populate_hashes(key, seeds.subspan(base, n), h);
    for (std::size_t i = 0; i < n; ++i) {
      table_[(h[i] & mask_) + ((base + i) * width_)] += c;
    }
  }
}

auto sketch::query_unrolled(std::string_view key) const noexcept -> std::uint32_t {
  std::array<std::uint32_t, kUnrolledDepth> h{};
  populate_hashes(key, seeds_, h);
  const std::size_t w = width_;
  std::uint32_t est = table_[(h[0] & mask_)];
  est = std::min(est, table_[(h[1] & mask_) + w]);
  est = std::min(est, table_[(h[2] & mask_) + (2 * w)]);
  est = std::min(est, table_[(h[3] & mask_) + (3 * w)]);
  est = std::min(est, table_[(h[4] & mask_) + (4 * w)]);
  return est;
}

auto sketch::query_generic(std::string_view key) const noexcept -> std::uint32_t {
  if (depth_ == 0) {
    return 0; // default-constructed
  }
  std::array<std::uint32_t, kHashBlock> h{};
  const std::span<const std::uint32_t> seeds{seeds_};
  std::uint32_t est = std::numeric_limits<std::uint32_t>::max();
  for (std::size_t base = 0; base < depth_; base += kHashBlock) {
    const std::size_t n = std::min(kHashBlock, depth_ - base);
    populate_hashes(key, seeds.subspan(base, n), h);
    for (std::size_t i = 0; i < n; ++i) {
      est = std::min(est, table_[(h[i] & mask_) + ((base + i) * width_)]);
    }
  }
  return est;
}

auto sketch::merge(const sketch& other) -> result<void> {
  if (!same_params(other)) {
    return result<void>::from_error(make_error(errc::dimension_mismatch, std::to_string(width_) + "x" +
                                                                             std::to_string(depth_) + " vs " +
                                                                             std::to_string(other.width_) + "x" +
                                                                             std::to_string(other.depth_)));
  }
  for (std::size_t i = 0; i < table_.size(); ++i) {
    table_[i] += other.table_[i];
  }
  return {};
}

void sketch::clear() noexcept {
  std::fill(table_.begin(), table_.end(), 0U);
}

} // namespace cmsketch
