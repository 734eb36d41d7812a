#include "cmsketch/error.hpp"
#include "cmsketch/sketch.hpp"
#include <cstdint>
#include <limits>
#include <string>

#include "nlohmann/json.hpp"

using cmsketch::errc;
using cmsketch::make_error;
using cmsketch::result;

namespace cmsketch {

namespace {
constexpr auto kCounterMax = static_cast<std::uint64_t>(std::numeric_limits<std::uint32_t>::max());

// A missing, non-integer or zero dimension is a format error. Negative values
// are passed on so that sketch::make reports them as invalid dimensions.
inline auto read_dimension(const nlohmann::json& data, const char* field, std::int64_t& out) -> bool {
  const auto it = data.find(field);
  if (it == data.end() || !it->is_number_integer()) {
    return false;
  }
  if (it->is_number_unsigned()) {
    const auto v = it->get<std::uint64_t>();
    if (v == 0U || v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return false;
    }
    out = static_cast<std::int64_t>(v);
    return true;
  }
  out = it->get<std::int64_t>();
  return out != 0;
}

inline auto read_counter(const nlohmann::json& entry, std::uint32_t& out) -> bool {
  if (entry.is_number_unsigned()) {
    const auto v = entry.get<std::uint64_t>();
    if (v > kCounterMax) {
      return false;
    }
    out = static_cast<std::uint32_t>(v);
    return true;
  }
  if (entry.is_number_integer()) {
    const auto v = entry.get<std::int64_t>();
    if (v < 0 || static_cast<std::uint64_t>(v) > kCounterMax) {
      return false;
    }
    out = static_cast<std::uint32_t>(v);
    return true;
  }
  return false;
}
} // namespace

auto sketch::serialize() const -> nlohmann::json {
  nlohmann::json j;
  j["width"] = width_;
  j["depth"] = depth_;
  j["table"] = table_;
  return j;
}

auto sketch::deserialize(const nlohmann::json& data, const diagnostic_sink& sink) -> result<sketch> {
  if (!data.is_object()) {
    return result<sketch>::from_error(make_error(errc::invalid_format, "not an object"));
  }
  std::int64_t width = 0;
  std::int64_t depth = 0;
  if (!read_dimension(data, "width", width)) {
    return result<sketch>::from_error(make_error(errc::invalid_format, "missing width"));
  }
  if (!read_dimension(data, "depth", depth)) {
    return result<sketch>::from_error(make_error(errc::invalid_format, "missing depth"));
  }
  const auto table_it = data.find("table");
  if (table_it == data.end() || !table_it->is_array()) {
    return result<sketch>::from_error(make_error(errc::invalid_format, "missing table"));
  }

  // Check the table length against the normalized dimensions before allocating anything.
  if (width > 0 && depth > 0) {
    const std::uint64_t w = next_pow2(static_cast<std::uint64_t>(width));
    const auto d = static_cast<std::uint64_t>(depth);
    const std::uint64_t n = table_it->size();
    if (w <= kMaxWidth && (d > n / w || d * w != n)) {
      return result<sketch>::from_error(make_error(errc::table_length_mismatch,
                                                   "expected " + std::to_string(w) + "x" + std::to_string(d) +
                                                       ", got " + std::to_string(n)));
    }
  }

  auto made = make(width, depth, sink);
  if (!made) {
    return result<sketch>::from_error(std::move(made).error());
  }
  sketch s = std::move(made).value();
  std::size_t i = 0;
  for (const auto& entry : *table_it) {
    if (!read_counter(entry, s.table_[i])) {
      return result<sketch>::from_error(
          make_error(errc::invalid_format, "table[" + std::to_string(i) + "] is not a 32-bit counter"));
    }
    ++i;
  }
  return s;
}

} // namespace cmsketch
