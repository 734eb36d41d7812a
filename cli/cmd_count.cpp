#include "cmsketch/sketch.hpp"
#include "cmsketch/snapshot.hpp"
#include "options.hpp"
#include "util/parse.hpp"
#include "util/spsc_ring.hpp"
#include "util/string_utils.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"

using cmsketch::cli::CommandResult;
using cmsketch::cli::util::option_value;
using cmsketch::cli::util::parse_double;
using cmsketch::cli::util::parse_i64;
using cmsketch::cli::util::spsc_ring;

namespace cmsketch::cli {

namespace {

struct CountOptions {
  bool show_help{false};
  bool have_eps{false};
  bool have_delta{false};
  bool have_width{false};
  bool have_depth{false};
  double eps{1e-3};
  double delta{1e-2};
  std::int64_t width{0};
  std::int64_t depth{0};
  std::string out_path; // "-" => snapshot to stdout
  std::vector<std::string> keys;
};

using LineRing = spsc_ring<std::string>;

constexpr std::size_t kRingCapacity = 1U << 14;

void print_help();
auto parse_count_opts(int argc, char** argv, CountOptions& o) -> bool;
auto decide_num_workers(int requested) -> int;
auto make_configured(const CountOptions& co, const GlobalOptions& g) -> result<sketch>;
auto open_input(const GlobalOptions& g, std::ifstream& file_in, std::istream*& in) -> bool;
void worker_loop(LineRing& ring, sketch& sk, const std::atomic<bool>& done);
auto feed_lines(std::istream& in, const std::vector<std::unique_ptr<LineRing>>& rings, const GlobalOptions& g,
                std::atomic<std::uint64_t>& processed) -> void;
auto start_stats(const GlobalOptions& g, const std::atomic<bool>& done, const std::atomic<std::uint64_t>& processed)
    -> std::thread;
auto report(const sketch& global, const CountOptions& co, const GlobalOptions& g, std::uint64_t lines)
    -> CommandResult;

} // namespace

auto cmd_count(int argc, char** argv, const GlobalOptions& g) -> CommandResult {
  CountOptions co{};
  if (!parse_count_opts(argc, argv, co)) {
    print_help();
    return CommandResult::ConfigError;
  }
  if (co.show_help) {
    print_help();
    return CommandResult::Success;
  }

  auto global_r = make_configured(co, g);
  if (!global_r) {
    std::fprintf(stderr, "error: %s\n", global_r.error().message().c_str());
    return CommandResult::ConfigError;
  }
  sketch global = std::move(global_r).value();

  std::ifstream file_in;
  std::istream* in = nullptr;
  if (!open_input(g, file_in, in)) {
    return CommandResult::IOError;
  }

  // One private sketch per worker; a sketch instance is never shared between writers.
  const int num_workers = decide_num_workers(g.threads);
  std::vector<sketch> locals;
  std::vector<std::unique_ptr<LineRing>> rings;
  locals.reserve(static_cast<std::size_t>(num_workers));
  rings.reserve(static_cast<std::size_t>(num_workers));
  for (int i = 0; i < num_workers; ++i) {
    locals.emplace_back(global.clone());
    rings.emplace_back(std::make_unique<LineRing>(kRingCapacity));
  }

  std::atomic<bool> done{false};
  std::atomic<std::uint64_t> processed{0};
  std::vector<std::thread> workers;
  workers.reserve(static_cast<std::size_t>(num_workers));
  for (int i = 0; i < num_workers; ++i) {
    const auto idx = static_cast<std::size_t>(i);
    workers.emplace_back([&rings, &locals, &done, idx]() -> void { worker_loop(*rings[idx], locals[idx], done); });
  }
  std::thread stats_thr = start_stats(g, done, processed);

  feed_lines(*in, rings, g, processed);
  done.store(true, std::memory_order_release);
  for (auto& w : workers) {
    w.join();
  }
  if (stats_thr.joinable()) {
    stats_thr.join();
  }

  for (const auto& tl : locals) {
    auto m = global.merge(tl);
    if (!m) {
      std::fprintf(stderr, "error: %s\n", m.error().message().c_str());
      return CommandResult::GeneralError;
    }
  }
  return report(global, co, g, processed.load(std::memory_order_relaxed));
}

} // namespace cmsketch::cli

// ==================== Details (helper implementations) ====================
namespace cmsketch::cli {
namespace {

void print_help() {
  std::fputs("usage: cmsketch count [--eps=<e>] [--delta=<d>] | [--width=<w> --depth=<d>]\n"
             "                      [--out=<path>|-] [--key=<k>]...\n"
             "  reads one key per line; defaults eps=0.001 delta=0.01\n",
             stdout);
}

auto parse_count_opts(int argc, char** argv, CountOptions& o) -> bool {
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  for (int i = 0; i < argc; ++i) {
    const std::string_view a{argv[i]};
    std::string_view val;
    if (a == std::string_view{"--help"}) {
      o.show_help = true;
      return true;
    }
    if (option_value(a, "--eps=", val)) {
      if (!parse_double(val, o.eps)) {
        std::fputs("error: invalid --eps\n", stderr);
        return false;
      }
      o.have_eps = true;
    } else if (option_value(a, "--delta=", val)) {
      if (!parse_double(val, o.delta)) {
        std::fputs("error: invalid --delta\n", stderr);
        return false;
      }
      o.have_delta = true;
    } else if (option_value(a, "--width=", val)) {
      if (!parse_i64(val, o.width)) {
        std::fputs("error: invalid --width\n", stderr);
        return false;
      }
      o.have_width = true;
    } else if (option_value(a, "--depth=", val)) {
      if (!parse_i64(val, o.depth)) {
        std::fputs("error: invalid --depth\n", stderr);
        return false;
      }
      o.have_depth = true;
    } else if (option_value(a, "--out=", val)) {
      o.out_path = std::string(val);
    } else if (option_value(a, "--key=", val)) {
      o.keys.emplace_back(val);
    } else {
      std::fprintf(stderr, "error: unknown count option: %.*s\n", static_cast<int>(a.size()), a.data());
      return false;
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (o.have_width != o.have_depth) {
    std::fputs("error: --width and --depth must be given together\n", stderr);
    return false;
  }
  if (o.have_width && (o.have_eps || o.have_delta)) {
    std::fputs("error: use either --eps/--delta or --width/--depth\n", stderr);
    return false;
  }
  return true;
}

auto decide_num_workers(int requested) -> int {
  if (requested > 0) {
    return requested;
  }
  const int hw = static_cast<int>(std::thread::hardware_concurrency());
  return (hw > 0) ? hw : 1;
}

auto make_configured(const CountOptions& co, const GlobalOptions& g) -> result<sketch> {
  if (co.have_width) {
    return sketch::make(co.width, co.depth, g.sink());
  }
  return sketch::make(Config{.eps = co.eps, .delta = co.delta}, g.sink());
}

auto open_input(const GlobalOptions& g, std::ifstream& file_in, std::istream*& in) -> bool {
  if (g.file_path.empty() || g.file_path == "-") {
    in = &std::cin;
    return true;
  }
  file_in.open(g.file_path, std::ios::in);
  if (!file_in.is_open()) {
    std::fprintf(stderr, "error: failed to open --file %s\n", g.file_path.c_str());
    return false;
  }
  in = &file_in;
  return true;
}

void worker_loop(LineRing& ring, sketch& sk, const std::atomic<bool>& done) {
  std::string line;
  while (true) {
    if (ring.pop(line)) {
      sk.update(line);
    } else if (done.load(std::memory_order_acquire)) {
      // the reader finished before raising done, so an empty ring now stays empty
      if (ring.empty()) {
        break;
      }
    } else {
      std::this_thread::sleep_for(std::chrono::microseconds(50));
    }
  }
}

auto feed_lines(std::istream& in, const std::vector<std::unique_ptr<LineRing>>& rings, const GlobalOptions& g,
                std::atomic<std::uint64_t>& processed) -> void {
  std::string line;
  line.reserve(256);
  std::uint64_t n = 0;
  std::size_t shard = 0;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    while (!rings[shard]->try_push(std::move(line))) {
      std::this_thread::sleep_for(std::chrono::microseconds(50));
    }
    line.clear();
    shard = (shard + 1) % rings.size();
    processed.fetch_add(1, std::memory_order_relaxed);
    if (g.stop_after != 0 && ++n >= g.stop_after) {
      break;
    }
  }
}

auto start_stats(const GlobalOptions& g, const std::atomic<bool>& done, const std::atomic<std::uint64_t>& processed)
    -> std::thread {
  if (!g.stats) {
    return std::thread{};
  }
  return std::thread([&g, &done, &processed]() -> void {
    const auto interval = std::chrono::seconds(g.stats_interval_seconds);
    const auto quantum = std::chrono::milliseconds(100);
    auto next = std::chrono::steady_clock::now() + interval;
    while (!done.load(std::memory_order_acquire)) {
      std::this_thread::sleep_for(quantum);
      if (std::chrono::steady_clock::now() >= next) {
        std::fprintf(stderr, "processed=%llu\n",
                     static_cast<unsigned long long>(processed.load(std::memory_order_relaxed)));
        next += interval;
      }
    }
  });
}

auto report(const sketch& global, const CountOptions& co, const GlobalOptions& g, std::uint64_t lines)
    -> CommandResult {
  if (co.out_path == "-") {
    std::fputs(snapshot::to_string(global).c_str(), stdout);
    std::fputc('\n', stdout);
  } else if (!co.out_path.empty()) {
    auto saved = snapshot::save_file(global, co.out_path);
    if (!saved) {
      std::fprintf(stderr, "error: %s\n", saved.error().message().c_str());
      return CommandResult::IOError;
    }
  }

  if (g.json) {
    nlohmann::json j;
    j["width"] = global.width();
    j["depth"] = global.depth();
    j["lines"] = lines;
    if (!co.keys.empty()) {
      auto& ests = j["estimates"] = nlohmann::json::array();
      for (const auto& k : co.keys) {
        ests.push_back(nlohmann::json{{"key", k}, {"est", global.query(k)}});
      }
    }
    if (co.out_path != "-") {
      std::fprintf(stdout, "%s\n", j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace).c_str());
    }
    return CommandResult::Success;
  }

  for (const auto& k : co.keys) {
    std::fprintf(stdout, "%s\t%u\n", k.c_str(), static_cast<unsigned>(global.query(k)));
  }
  if (co.keys.empty() && co.out_path != "-") {
    std::fprintf(stdout, "count: processed %llu lines (width=%zu, depth=%zu)\n", static_cast<unsigned long long>(lines),
                 global.width(), global.depth());
  }
  return CommandResult::Success;
}

} // namespace
} // namespace cmsketch::cli
