#pragma once

#include <string>
#include <string_view>

#include "cmsketch/diagnostics.hpp"
#include "cmsketch/expected.hpp"
#include "cmsketch/sketch.hpp"

namespace cmsketch::snapshot {

// JSON text of sketch::serialize(); indent < 0 gives the compact form
[[nodiscard]] auto to_string(const sketch& s, int indent = -1) -> std::string;
// Unparsable text is reported as errc::invalid_format
[[nodiscard]] auto from_string(std::string_view text, const diagnostic_sink& sink = {}) -> result<sketch>;

[[nodiscard]] auto save_file(const sketch& s, const std::string& path) -> result<void>;
[[nodiscard]] auto load_file(const std::string& path, const diagnostic_sink& sink = {}) -> result<sketch>;

} // namespace cmsketch::snapshot
