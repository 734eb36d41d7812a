#include "options_parse.hpp"

#include "util/parse.hpp"
#include "util/string_utils.hpp"

#include <array>
#include <cstdio>
#include <iterator>
#include <string>
#include <string_view>

using cmsketch::cli::OptionResult;
using cmsketch::cli::util::option_value;
using cmsketch::cli::util::parse_u64;

namespace cmsketch::cli {

void print_root_help() {
  std::fputs("cmsketch: approximate key frequencies with a Count-Min sketch\n"
             "usage: cmsketch [global-options] <subcommand> [subcommand-options]\n"
             "  subcommands: count | query | merge | info\n\n"
             "global-options:\n"
             "  --threads=<N>          number of worker threads for count (default: HW threads)\n"
             "  --file=<path>          read keys from file (default: stdin)\n"
             "  --json                 machine-readable output\n"
             "  --stop-after=<count>   stop after processing N lines\n"
             "  --stats[=<seconds>]    print periodic progress to stderr (default interval: 5s)\n"
             "  --verbose              log sketch sizing decisions to stderr\n",
             stdout);
}

namespace {

using HandlerFn = OptionResult (*)(std::string_view, GlobalOptions&);

inline auto handle_json(std::string_view a, GlobalOptions& g) -> OptionResult {
  if (a == "--json") {
    g.json = true;
    return OptionResult::Handled;
  }
  return OptionResult::NotHandled;
}
inline auto handle_verbose(std::string_view a, GlobalOptions& g) -> OptionResult {
  if (a == "--verbose") {
    g.verbose = true;
    return OptionResult::Handled;
  }
  return OptionResult::NotHandled;
}
inline auto handle_threads(std::string_view a, GlobalOptions& g) -> OptionResult {
  std::string_view val;
  if (!option_value(a, "--threads=", val)) {
    return OptionResult::NotHandled;
  }
  std::uint64_t v = 0;
  if (!parse_u64(val, v) || v == 0 || v > 1024) {
    std::fputs("error: invalid --threads value\n", stderr);
    return OptionResult::Error;
  }
  g.threads = static_cast<int>(v);
  return OptionResult::Handled;
}
inline auto handle_file(std::string_view a, GlobalOptions& g) -> OptionResult {
  std::string_view val;
  if (!option_value(a, "--file=", val)) {
    return OptionResult::NotHandled;
  }
  g.file_path = std::string(val);
  return OptionResult::Handled;
}
inline auto handle_stop_after(std::string_view a, GlobalOptions& g) -> OptionResult {
  std::string_view val;
  if (!option_value(a, "--stop-after=", val)) {
    return OptionResult::NotHandled;
  }
  std::uint64_t v = 0;
  if (!parse_u64(val, v)) {
    std::fputs("error: invalid --stop-after value\n", stderr);
    return OptionResult::Error;
  }
  g.stop_after = v;
  return OptionResult::Handled;
}
inline auto handle_stats(std::string_view a, GlobalOptions& g) -> OptionResult {
  if (a == "--stats") {
    g.stats = true;
    g.stats_interval_seconds = 5U;
    return OptionResult::Handled;
  }
  std::string_view val;
  if (!option_value(a, "--stats=", val)) {
    return OptionResult::NotHandled;
  }
  std::uint64_t v = 0;
  if (!parse_u64(val, v) || v == 0 || v > 3600) {
    std::fputs("error: invalid --stats value (1..3600)\n", stderr);
    return OptionResult::Error;
  }
  g.stats = true;
  g.stats_interval_seconds = static_cast<unsigned>(v);
  return OptionResult::Handled;
}

constexpr std::array<HandlerFn, 6> kGlobalHandlers{handle_json,       handle_verbose, handle_threads,
                                                   handle_file,       handle_stats,   handle_stop_after};

inline auto process_global_option(std::string_view a, GlobalOptions& g) -> OptionResult {
  if (a.empty() || a.front() != '-') {
    return OptionResult::SubcommandStart;
  }
  if (a == "--help") {
    print_root_help();
    return OptionResult::HelpShown;
  }
  for (auto fn : kGlobalHandlers) {
    const OptionResult r = fn(a, g);
    if (r != OptionResult::NotHandled) {
      return r;
    }
  }
  std::fprintf(stderr, "error: unknown option: %.*s\n", static_cast<int>(a.size()), a.data());
  return OptionResult::Error;
}

inline auto safe_argv_at(char** argv, int argc, int index) -> char* {
  if (index >= 0 && index < argc) {
    return *std::next(argv, index);
  }
  return nullptr;
}

} // namespace

[[nodiscard]] auto parse_global_options(int argc, char** argv, GlobalOptions& g) -> ParseResult {
  int argi = 1;
  for (; argi < argc; ++argi) {
    char* arg_ptr = safe_argv_at(argv, argc, argi);
    if (arg_ptr == nullptr) {
      break;
    }
    const std::string_view a{arg_ptr};
    const OptionResult r = process_global_option(a, g);
    if (r == OptionResult::HelpShown) {
      return ParseResult{.status = ExitCode::Success, .next_index = -1};
    }
    if (r == OptionResult::Error) {
      return ParseResult{.status = ExitCode::ArgumentError, .next_index = -1};
    }
    if (r == OptionResult::SubcommandStart) {
      break;
    }
  }
  return ParseResult{.status = ExitCode::Success, .next_index = argi};
}

} // namespace cmsketch::cli
