#pragma once

#include <cstdint>
#include <string>

#include "cmsketch/diagnostics.hpp"

namespace cmsketch::cli {

enum class OptionResult : std::uint8_t {
  HelpShown = 0,
  Handled = 1,
  NotHandled = 2,
  SubcommandStart = 3,
  Error = 255
};

enum class CommandResult : std::uint8_t {
  Success = 0,
  GeneralError = 2,
  IOError = 3,
  ConfigError = 5
};

enum class ExitCode : std::uint8_t {
  Success = 0,
  GeneralError = 1,
  ArgumentError = 2
};

constexpr auto to_int(OptionResult r) -> int {
  return static_cast<int>(r);
}
constexpr auto to_int(CommandResult r) -> int {
  return static_cast<int>(r);
}
constexpr auto to_int(ExitCode r) -> int {
  return static_cast<int>(r);
}

struct GlobalOptions {
  int threads{0};        // 0 => use hardware_concurrency
  std::string file_path; // empty => stdin
  bool json{false};
  std::uint64_t stop_after{0}; // lines; 0 => unlimited
  bool stats{false};
  unsigned stats_interval_seconds{5}; // default interval when --stats is present without value
  bool verbose{false};                // log sizing diagnostics to stderr

  [[nodiscard]] auto sink() const -> diagnostic_sink {
    return verbose ? stderr_sink() : diagnostic_sink{};
  }
};

auto cmd_count(int argc, char** argv, const GlobalOptions& g) -> CommandResult;
auto cmd_query(int argc, char** argv, const GlobalOptions& g) -> CommandResult;
auto cmd_merge(int argc, char** argv, const GlobalOptions& g) -> CommandResult;
auto cmd_info(int argc, char** argv, const GlobalOptions& g) -> CommandResult;

} // namespace cmsketch::cli
