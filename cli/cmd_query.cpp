#include "cmsketch/sketch.hpp"
#include "cmsketch/snapshot.hpp"
#include "options.hpp"
#include "util/string_utils.hpp"
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

using cmsketch::cli::CommandResult;
using cmsketch::cli::util::option_value;

namespace cmsketch::cli {

namespace {

struct SnapshotArgs {
  bool show_help{false};
  std::string sketch_path;
  std::vector<std::string> keys; // positional
};

auto parse_snapshot_args(int argc, char** argv, SnapshotArgs& o) -> bool {
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  for (int i = 0; i < argc; ++i) {
    const std::string_view a{argv[i]};
    std::string_view val;
    if (a == "--help") {
      o.show_help = true;
      return true;
    }
    if (option_value(a, "--sketch=", val)) {
      o.sketch_path = std::string(val);
    } else if (a == "--") {
      for (int j = i + 1; j < argc; ++j) {
        o.keys.emplace_back(argv[j]);
      }
      break;
    } else if (!a.empty() && a.front() == '-' && a.size() > 1) {
      std::fprintf(stderr, "error: unknown option: %.*s\n", static_cast<int>(a.size()), a.data());
      return false;
    } else {
      o.keys.emplace_back(a);
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (o.sketch_path.empty()) {
    std::fputs("error: --sketch=<path> is required\n", stderr);
    return false;
  }
  return true;
}

auto load_or_report(const SnapshotArgs& o, const GlobalOptions& g, result<sketch>& out) -> bool {
  out = snapshot::load_file(o.sketch_path, g.sink());
  if (!out) {
    std::fprintf(stderr, "error: %s\n", out.error().message().c_str());
    return false;
  }
  return true;
}

} // namespace

auto cmd_query(int argc, char** argv, const GlobalOptions& g) -> CommandResult {
  SnapshotArgs o{};
  if (!parse_snapshot_args(argc, argv, o) || o.show_help) {
    std::fputs("usage: cmsketch query --sketch=<path> [--] <key>...\n", stdout);
    return o.show_help ? CommandResult::Success : CommandResult::ConfigError;
  }
  result<sketch> loaded{make_error(errc::invalid_argument)};
  if (!load_or_report(o, g, loaded)) {
    return CommandResult::IOError;
  }
  const sketch& sk = loaded.value();

  if (g.json) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& k : o.keys) {
      arr.push_back(nlohmann::json{{"key", k}, {"est", sk.query(k)}});
    }
    std::fprintf(stdout, "%s\n", arr.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace).c_str());
    return CommandResult::Success;
  }
  for (const auto& k : o.keys) {
    std::fprintf(stdout, "%s\t%u\n", k.c_str(), static_cast<unsigned>(sk.query(k)));
  }
  return CommandResult::Success;
}

auto cmd_info(int argc, char** argv, const GlobalOptions& g) -> CommandResult {
  SnapshotArgs o{};
  if (!parse_snapshot_args(argc, argv, o) || o.show_help) {
    std::fputs("usage: cmsketch info --sketch=<path>\n", stdout);
    return o.show_help ? CommandResult::Success : CommandResult::ConfigError;
  }
  result<sketch> loaded{make_error(errc::invalid_argument)};
  if (!load_or_report(o, g, loaded)) {
    return CommandResult::IOError;
  }
  const sketch& sk = loaded.value();

  // Every update adds its count once per row, so row 0 sums to N until a counter wraps.
  std::uint64_t mass = 0;
  for (const std::uint32_t c : sk.table().first(sk.width())) {
    mass += c;
  }
  if (g.json) {
    nlohmann::json j;
    j["width"] = sk.width();
    j["depth"] = sk.depth();
    j["mass"] = mass;
    std::fprintf(stdout, "%s\n", j.dump().c_str());
  } else {
    std::fprintf(stdout, "width=%zu depth=%zu mass=%llu\n", sk.width(), sk.depth(),
                 static_cast<unsigned long long>(mass));
  }
  return CommandResult::Success;
}

} // namespace cmsketch::cli
