#include "options.hpp"
#include "options_parse.hpp"
#include <array>
#include <cstdio>
#include <iterator>
#include <string_view>

using cmsketch::cli::CommandResult;
using cmsketch::cli::ExitCode;
using cmsketch::cli::print_root_help;
using cmsketch::cli::to_int;

namespace {

struct SubCmd {
  std::string_view name;
  CommandResult (*fn)(int, char**, const cmsketch::cli::GlobalOptions&);
};

constexpr std::array<SubCmd, 4> kSubCmds{{
    {.name = "count", .fn = cmsketch::cli::cmd_count},
    {.name = "query", .fn = cmsketch::cli::cmd_query},
    {.name = "merge", .fn = cmsketch::cli::cmd_merge},
    {.name = "info", .fn = cmsketch::cli::cmd_info},
}};

[[nodiscard]] inline auto dispatch_command(int argc, char** argv, int cmd_start, const cmsketch::cli::GlobalOptions& g)
    -> ExitCode {
  if (cmd_start >= argc) {
    print_root_help();
    return ExitCode::Success;
  }

  char* cmd_ptr = (cmd_start >= 0 && cmd_start < argc) ? *std::next(argv, cmd_start) : nullptr;
  if (cmd_ptr == nullptr) {
    print_root_help();
    return ExitCode::GeneralError;
  }
  const std::string_view cmd{cmd_ptr};
  const int cmd_argc = argc - cmd_start - 1;
  char** cmd_argv = std::next(argv, cmd_start + 1);

  for (const auto& sc : kSubCmds) {
    if (cmd == sc.name) {
      const CommandResult r = sc.fn(cmd_argc, cmd_argv, g);
      return (r == CommandResult::Success) ? ExitCode::Success : ExitCode::GeneralError;
    }
  }

  std::fprintf(stderr, "error: unknown subcommand: %.*s\n", static_cast<int>(cmd.size()), cmd.data());
  print_root_help();
  return ExitCode::ArgumentError;
}

} // namespace

auto main(int argc, char** argv) -> int {
  cmsketch::cli::GlobalOptions g{};

  if (argc <= 1) {
    print_root_help();
    return to_int(ExitCode::Success);
  }

  const cmsketch::cli::ParseResult pr = parse_global_options(argc, argv, g);
  if (pr.status == ExitCode::Success && pr.next_index < 0) {
    return to_int(ExitCode::Success);
  }
  if (pr.status != ExitCode::Success) {
    return to_int(ExitCode::ArgumentError);
  }

  return to_int(dispatch_command(argc, argv, pr.next_index, g));
}
