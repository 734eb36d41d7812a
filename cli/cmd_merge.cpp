#include "cmsketch/sketch.hpp"
#include "cmsketch/snapshot.hpp"
#include "options.hpp"
#include "util/string_utils.hpp"
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

using cmsketch::cli::CommandResult;
using cmsketch::cli::util::option_value;

namespace cmsketch::cli {

namespace {

struct MergeOptions {
  bool show_help{false};
  std::string out_path; // "-" => stdout
  std::vector<std::string> inputs;
};

inline void print_usage() {
  std::fputs("usage: cmsketch merge --out=<path>|- <snapshot> <snapshot>...\n"
             "  all snapshots must share width and depth\n",
             stdout);
}

auto parse_merge_options(int argc, char** argv, MergeOptions& o) -> bool {
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  for (int i = 0; i < argc; ++i) {
    const std::string_view a{argv[i]};
    std::string_view val;
    if (a == "--help") {
      o.show_help = true;
      return true;
    }
    if (option_value(a, "--out=", val)) {
      o.out_path = std::string(val);
    } else if (!a.empty() && a.front() == '-' && a != "-") {
      std::fprintf(stderr, "error: unknown merge option: %.*s\n", static_cast<int>(a.size()), a.data());
      return false;
    } else {
      o.inputs.emplace_back(a);
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (o.out_path.empty()) {
    std::fputs("error: --out=<path> is required\n", stderr);
    return false;
  }
  if (o.inputs.size() < 2) {
    std::fputs("error: merge needs at least two snapshots\n", stderr);
    return false;
  }
  return true;
}

} // namespace

auto cmd_merge(int argc, char** argv, const GlobalOptions& g) -> CommandResult {
  MergeOptions o{};
  if (!parse_merge_options(argc, argv, o)) {
    print_usage();
    return CommandResult::ConfigError;
  }
  if (o.show_help) {
    print_usage();
    return CommandResult::Success;
  }

  auto acc_r = snapshot::load_file(o.inputs.front(), g.sink());
  if (!acc_r) {
    std::fprintf(stderr, "error: %s\n", acc_r.error().message().c_str());
    return CommandResult::IOError;
  }
  sketch acc = std::move(acc_r).value();

  for (std::size_t i = 1; i < o.inputs.size(); ++i) {
    auto next = snapshot::load_file(o.inputs[i], g.sink());
    if (!next) {
      std::fprintf(stderr, "error: %s\n", next.error().message().c_str());
      return CommandResult::IOError;
    }
    auto merged = acc.merge(next.value());
    if (!merged) {
      merged.error().append_context(o.inputs[i]);
      std::fprintf(stderr, "error: %s\n", merged.error().message().c_str());
      return CommandResult::GeneralError;
    }
  }

  if (o.out_path == "-") {
    std::fprintf(stdout, "%s\n", snapshot::to_string(acc).c_str());
    return CommandResult::Success;
  }
  auto saved = snapshot::save_file(acc, o.out_path);
  if (!saved) {
    std::fprintf(stderr, "error: %s\n", saved.error().message().c_str());
    return CommandResult::IOError;
  }
  if (g.json) {
    std::fprintf(stdout, "{\"merged\":%zu,\"width\":%zu,\"depth\":%zu}\n", o.inputs.size(), acc.width(), acc.depth());
  } else {
    std::fprintf(stdout, "merge: %zu snapshots -> %s\n", o.inputs.size(), o.out_path.c_str());
  }
  return CommandResult::Success;
}

} // namespace cmsketch::cli
