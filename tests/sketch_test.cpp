#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>
#include <vector>

#include "cmsketch/diagnostics.hpp"
#include "cmsketch/hash.hpp"
#include "cmsketch/sketch.hpp"

using cmsketch::diagnostic;
using cmsketch::errc;
using cmsketch::event_kind;
using cmsketch::sketch;
using cmsketch::hashing::fnv1a32;

namespace tests {

static auto must(cmsketch::result<sketch>&& r) -> sketch {
  if (!r) {
    std::fprintf(stderr, "unexpected error: %s\n", r.error().message().c_str());
  }
  assert(r.has_value());
  return std::move(r).value();
}

static void test_direct_construction() {
  auto s1 = must(sketch::make(1024, 5));
  assert(s1.width() == 1024);
  assert(s1.depth() == 5);
  assert(s1.table().size() == 1024U * 5U);
  assert(s1.seeds().size() == 5);
  for (std::size_t i = 0; i < s1.seeds().size(); ++i) {
    assert(s1.seeds()[i] == i);
  }
  assert(std::all_of(s1.table().begin(), s1.table().end(), [](std::uint32_t c) { return c == 0U; }));

  auto s2 = must(sketch::make(1000, 4)); // rounded up
  assert(s2.width() == 1024);
  assert(s2.depth() == 4);

  auto s3 = must(sketch::make(1, 1));
  assert(s3.width() == 1);
  assert(s3.table().size() == 1);
}

static void test_estimate_construction() {
  auto s = must(sketch::make_by_eps_delta(0.01, 0.01));
  assert(s.width() >= static_cast<std::size_t>(std::ceil(std::exp(1.0) / 0.01)));
  assert(s.width() == 512); // ceil(e/0.01)=272 -> 512
  assert(s.depth() == 5);   // ceil(ln(100)) = 5
  assert(s.table().size() == s.width() * s.depth());

  auto dims = cmsketch::compute_dims(0.001, 0.01);
  assert(dims.has_value());
  assert(dims.value().raw_width == 2719);
  assert(dims.value().width == 4096);
  assert(dims.value().depth == 5);

  // delta close to 1 still yields one row
  auto shallow = cmsketch::compute_dims(0.5, 0.99);
  assert(shallow.has_value());
  assert(shallow.value().depth == 1);
  assert(shallow.value().width == 8); // ceil(5.43) = 6 -> 8

  auto via_config = must(sketch::make(cmsketch::Config{.eps = 0.01, .delta = 0.01}));
  assert(via_config.width() == 512 && via_config.depth() == 5);
}

static void test_next_pow2() {
  assert(cmsketch::next_pow2(0) == 1);
  assert(cmsketch::next_pow2(1) == 1);
  assert(cmsketch::next_pow2(2) == 2);
  assert(cmsketch::next_pow2(3) == 4);
  assert(cmsketch::next_pow2(272) == 512);
  assert(cmsketch::next_pow2(1024) == 1024);
  assert(cmsketch::next_pow2(1025) == 2048);
}

static void test_invalid_dimensions() {
  const auto zero_w = sketch::make(0, 5);
  assert(!zero_w.has_value());
  assert(zero_w.error().code == errc::invalid_dimension);

  const auto neg_d = sketch::make(10, -1);
  assert(!neg_d.has_value());
  assert(neg_d.error().code == errc::invalid_dimension);

  const auto huge = sketch::make(std::int64_t{1} << 40, 1);
  assert(!huge.has_value());
  assert(huge.error().code == errc::invalid_dimension);

  // more counters than a vector can hold
  const auto deep = sketch::make(1, std::int64_t{1} << 62);
  assert(!deep.has_value());
  assert(deep.error().code == errc::invalid_dimension);
  const auto wide_deep = sketch::make(std::int64_t{1} << 31, std::int64_t{1} << 40);
  assert(!wide_deep.has_value());
  assert(wide_deep.error().code == errc::invalid_dimension);
}

static void test_invalid_parameters() {
  const double bad[][2] = {{0.0, 0.01}, {1.1, 0.01}, {0.01, -0.1}, {0.01, 1.0}, {1.0, 0.5}, {-0.5, 0.5}};
  for (const auto& p : bad) {
    const auto r = sketch::make_by_eps_delta(p[0], p[1]);
    assert(!r.has_value());
    assert(r.error().code == errc::invalid_parameter);
  }
  const double nan = std::numeric_limits<double>::quiet_NaN();
  assert(!sketch::make_by_eps_delta(nan, 0.1).has_value());
  assert(!sketch::make_by_eps_delta(0.1, nan).has_value());
  assert(cmsketch::compute_dims(0.01, 0.0).error().code == errc::invalid_parameter);
}

static void test_diagnostic_sink() {
  std::vector<diagnostic> seen;
  const cmsketch::diagnostic_sink sink = [&seen](const diagnostic& d) { seen.push_back(d); };

  auto exact = must(sketch::make(1024, 5, sink));
  assert(seen.empty()); // nothing to adjust

  auto adjusted = must(sketch::make(1000, 4, sink));
  assert(seen.size() == 1);
  assert(seen[0].kind == event_kind::width_adjusted);
  assert(seen[0].requested_width == 1000);
  assert(seen[0].width == 1024);
  assert(cmsketch::describe(seen[0]).find("1024") != std::string::npos);

  seen.clear();
  auto estimated = must(sketch::make_by_eps_delta(0.01, 0.01, sink));
  assert(seen.size() == 1);
  assert(seen[0].kind == event_kind::dimensions_estimated);
  assert(seen[0].requested_width == 272);
  assert(seen[0].width == 512);
  assert(seen[0].depth == 5);
  assert(cmsketch::describe(seen[0]).find("272") != std::string::npos);
  assert(exact.width() == 1024 && exact.depth() == 5);
  assert(adjusted.width() == 1024 && adjusted.depth() == 4);
  assert(estimated.width() == 512 && estimated.depth() == 5);
}

static void test_update_and_query() {
  auto s = must(sketch::make_by_eps_delta(0.001, 0.01)); // 4096 x 5

  s.update("apple", 3);
  assert(s.query("apple") == 3);
  s.update("apple", 5);
  assert(s.query("apple") == 8);

  s.update("banana", 10);
  assert(s.query("banana") == 10);
  assert(s.query("apple") == 8);

  assert(s.query("orange") == 0); // never inserted, no collisions at this size

  s.update("grape");
  assert(s.query("grape") == 1);

  const auto before = s.query("grape");
  s.update("grape", 0);
  assert(s.query("grape") == before);
  s.update("grape", -5);
  assert(s.query("grape") == before);
}

static void test_clear() {
  auto s = must(sketch::make_by_eps_delta(0.01, 0.01));
  s.update("item1", 100);
  s.update("item2", 200);
  s.clear();
  assert(s.query("item1") == 0);
  assert(s.query("item2") == 0);
  assert(std::all_of(s.table().begin(), s.table().end(), [](std::uint32_t c) { return c == 0U; }));
  assert(s.width() == 512 && s.depth() == 5);
  assert(s.seeds().size() == 5 && s.seeds()[4] == 4);
}

static void test_merge() {
  auto a = must(sketch::make_by_eps_delta(0.01, 0.01));
  a.update("apple", 10);
  a.update("banana", 5);
  auto b = must(sketch::make_by_eps_delta(0.01, 0.01));
  b.update("apple", 7);
  b.update("orange", 12);

  auto m = a.merge(b);
  assert(m.has_value());
  assert(a.query("apple") == 17);
  assert(a.query("banana") == 5);
  assert(a.query("orange") == 12);
  assert(b.query("apple") == 7); // other untouched

  const std::vector<std::uint32_t> snapshot(a.table().begin(), a.table().end());
  auto narrower = must(sketch::make(static_cast<std::int64_t>(a.width() / 2), static_cast<std::int64_t>(a.depth())));
  auto mw = a.merge(narrower);
  assert(!mw.has_value());
  assert(mw.error().code == errc::dimension_mismatch);

  auto shallower = must(sketch::make(static_cast<std::int64_t>(a.width()), static_cast<std::int64_t>(a.depth() / 2 + 1)));
  auto md = a.merge(shallower);
  assert(!md.has_value());
  assert(md.error().code == errc::dimension_mismatch);
  assert(std::equal(snapshot.begin(), snapshot.end(), a.table().begin())); // rejected merges leave a intact
}

static void test_merge_order_independent() {
  auto base_a = must(sketch::make(256, 4));
  auto base_b = must(sketch::make(256, 4));
  for (int i = 0; i < 500; ++i) {
    base_a.update("a-" + std::to_string(i % 37), i % 5 + 1);
    base_b.update("b-" + std::to_string(i % 23), 2);
    base_b.update("a-" + std::to_string(i % 11));
  }
  auto ab = base_a.clone();
  auto ba = base_b.clone();
  assert(ab.merge(base_b).has_value());
  assert(ba.merge(base_a).has_value());
  assert(std::equal(ab.table().begin(), ab.table().end(), ba.table().begin()));
  for (int i = 0; i < 40; ++i) {
    const std::string k = "a-" + std::to_string(i);
    assert(ab.query(k) == ba.query(k));
  }
}

// Rebuilds the table from the hash family alone and compares it with the
// sketch, which covers the depth-5 fast path and the block-wise generic loop.
static void check_against_reference(std::int64_t width, std::int64_t depth) {
  auto s = must(sketch::make(width, depth));
  const std::size_t w = s.width();
  const std::size_t d = s.depth();
  std::vector<std::uint32_t> expected(w * d, 0U);
  auto ref_index = [&](const std::string& key, std::size_t row) -> std::size_t {
    return (fnv1a32(key, static_cast<std::uint32_t>(row)) & static_cast<std::uint32_t>(w - 1)) + (row * w);
  };

  for (int i = 0; i < 2000; ++i) {
    const std::string key = "key-" + std::to_string(i % 613);
    const int count = (i % 4) + 1;
    s.update(key, count);
    for (std::size_t r = 0; r < d; ++r) {
      expected[ref_index(key, r)] += static_cast<std::uint32_t>(count);
    }
  }
  assert(std::equal(expected.begin(), expected.end(), s.table().begin()));

  for (int i = 0; i < 700; ++i) {
    const std::string key = "key-" + std::to_string(i);
    std::uint32_t est = std::numeric_limits<std::uint32_t>::max();
    for (std::size_t r = 0; r < d; ++r) {
      est = std::min(est, expected[ref_index(key, r)]);
    }
    assert(s.query(key) == est);
  }
}

static void test_unrolled_matches_generic() {
  check_against_reference(1024, 5); // fast path
  check_against_reference(1024, 4);
  check_against_reference(1024, 1);
  check_against_reference(64, 6);
  check_against_reference(128, 33); // spans two hash blocks
}

static void test_counter_wraps() {
  auto s = must(sketch::make(16, 2));
  s.update("k", static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()));
  assert(s.query("k") == std::numeric_limits<std::uint32_t>::max());
  s.update("k", 2);
  assert(s.query("k") == 1);

  auto t = must(sketch::make(16, 2));
  t.update("j", (std::int64_t{1} << 32) + 5); // reduced modulo 2^32
  assert(t.query("j") == 5);
}

static void test_clone_is_independent() {
  auto s = must(sketch::make(64, 3));
  s.update("x", 4);
  auto c = s.clone();
  c.update("x", 6);
  assert(s.query("x") == 4);
  assert(c.query("x") == 10);
  assert(c.same_params(s));
}

static void test_default_constructed_is_empty() {
  const sketch s;
  assert(s.width() == 0 && s.depth() == 0);
  assert(s.query("anything") == 0);
}

static void test_moved_from_is_empty() {
  auto s = must(sketch::make(64, 3));
  s.update("x", 4);
  sketch t = std::move(s);
  assert(t.query("x") == 4);
  assert(s.width() == 0 && s.depth() == 0); // NOLINT(bugprone-use-after-move)
  assert(s.table().empty() && s.seeds().empty());
  assert(s.query("x") == 0);
  s.update("x", 1); // no rows to touch

  auto u = must(sketch::make(16, 5));
  u = std::move(t);
  assert(u.width() == 64 && u.depth() == 3);
  assert(u.query("x") == 4);
  assert(t.width() == 0 && t.query("x") == 0); // NOLINT(bugprone-use-after-move)
}

void run_sketch_tests() {
  test_direct_construction();
  test_estimate_construction();
  test_next_pow2();
  test_invalid_dimensions();
  test_invalid_parameters();
  test_diagnostic_sink();
  test_update_and_query();
  test_clear();
  test_merge();
  test_merge_order_independent();
  test_unrolled_matches_generic();
  test_counter_wraps();
  test_clone_is_independent();
  test_default_constructed_is_empty();
  test_moved_from_is_empty();
}

} // namespace tests
