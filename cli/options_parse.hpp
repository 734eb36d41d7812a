#pragma once

#include "options.hpp"

namespace cmsketch::cli {

struct ParseResult {
  ExitCode status;
  int next_index; // index of the subcommand in argv; -1 when parsing already finished the run
};

[[nodiscard]] auto parse_global_options(int argc, char** argv, GlobalOptions& g) -> ParseResult;

void print_root_help();

} // namespace cmsketch::cli
