#include "rxminer/benchmark.hpp"
#include "rxminer/config.hpp"
#include "rxminer/errors.hpp"
#include "rxminer/log.hpp"
#include "rxminer/miner.hpp"
#include "rxminer/perf.hpp"
#include "rxminer/types.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

rxminer::Miner* g_miner = nullptr;
std::atomic<bool> g_interrupted{false};

void handle_signal(int) {
  g_interrupted.store(true);
  if (g_miner != nullptr) {
    g_miner->request_stop();
  }
}

void install_signal_handlers() {
  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);
}

void print_usage(std::ostream& out) {
  out << "rxminer " << RXMINER_VERSION << "\n\n"
      << "Usage:\n"
      << "  rxminer start [--config <path>] [--workers <n>] [--algorithm <name>]\n"
      << "  rxminer benchmark --algorithm <name> [--duration <secs>] [--threads <n>]\n"
      << "  rxminer config [--output <path>] [--pool] [--node]\n\n"
      << "Algorithms: randomx (rx/0), cryptonight-v7 (cn/1), cryptonight-r (cn/r)\n"
      << "Log level: RXMINER_LOG=debug|info|warn|error\n";
}

struct StartOptions {
  std::filesystem::path config_path = "config.json";
  std::optional<uint32_t> workers;
  std::optional<std::string> algorithm;
};

struct BenchmarkCli {
  std::optional<std::string> algorithm;
  uint64_t duration_secs = 60;
  std::optional<uint32_t> threads;
};

struct ConfigCli {
  std::filesystem::path output = "config.json";
  bool pool = false;
  bool node = false;
};

class ArgReader {
public:
  ArgReader(int argc, char** argv, int first) : argc_(argc), argv_(argv), index_(first) {}

  bool done() const { return index_ >= argc_; }
  std::string_view next() { return argv_[index_++]; }

  std::string value(std::string_view flag) {
    if (index_ >= argc_) {
      throw rxminer::ConfigError(std::string(flag) + " requires a value");
    }
    return argv_[index_++];
  }

  uint64_t number(std::string_view flag) {
    const std::string text = value(flag);
    uint64_t out = 0;
    const auto res = std::from_chars(text.data(), text.data() + text.size(), out);
    if (res.ec != std::errc() || res.ptr != text.data() + text.size()) {
      throw rxminer::ConfigError(std::string(flag) + " expects a number, got '" + text + "'");
    }
    return out;
  }

private:
  int argc_;
  char** argv_;
  int index_;
};

[[noreturn]] void unknown_option(std::string_view command, std::string_view arg) {
  throw rxminer::ConfigError("unknown option for " + std::string(command) + ": " + std::string(arg));
}

rxminer::AlgorithmKind parse_algorithm_arg(const std::string& name) {
  const auto kind = rxminer::parse_algorithm_kind(name);
  if (!kind) {
    throw rxminer::ConfigError("unknown algorithm '" + name + "'");
  }
  return *kind;
}

int run_start(ArgReader args) {
  StartOptions opts;
  while (!args.done()) {
    const std::string_view arg = args.next();
    if (arg == "--config" || arg == "-c") {
      opts.config_path = args.value(arg);
    } else if (arg == "--workers" || arg == "-w") {
      opts.workers = static_cast<uint32_t>(args.number(arg));
    } else if (arg == "--algorithm" || arg == "-a") {
      opts.algorithm = args.value(arg);
    } else {
      unknown_option("start", arg);
    }
  }

  if (!std::filesystem::exists(opts.config_path)) {
    rxminer::write_config_template(opts.config_path, true, false);
    std::cout << "Created default config at: " << opts.config_path.string() << '\n';
    std::cout << "Set the pool url and your wallet address in that file, then run rxminer start again.\n";
    return 0;
  }

  auto config = rxminer::load_config(opts.config_path);
  if (opts.workers) {
    config.general.worker_threads = *opts.workers;
  }
  if (opts.algorithm) {
    config.general.algorithm = rxminer::algorithm_name(parse_algorithm_arg(*opts.algorithm));
  }
  if (!rxminer::apply_log_level_from_env()) {
    rxminer::LogLevel level;
    if (rxminer::parse_log_level(config.general.log_level, &level)) {
      rxminer::set_log_level(level);
    }
  }

  std::vector<std::string> notes;
  rxminer::sanitize_runtime_config(&config, &notes);
  rxminer::validate_config(config);

  rxminer::log_info("main", std::string("rxminer ") + RXMINER_VERSION + " | tuning: " + rxminer::platform_tuning_summary());
  for (const auto& note : notes) {
    rxminer::log_info("main", "auto-tuning: " + note);
  }

  rxminer::Miner miner(std::move(config));
  g_miner = &miner;
  install_signal_handlers();
  if (g_interrupted.load()) {
    miner.request_stop();
  }
  try {
    miner.run();
  } catch (const std::exception&) {
    g_miner = nullptr;
    throw;
  }
  g_miner = nullptr;
  return 0;
}

int run_benchmark_command(ArgReader args) {
  BenchmarkCli cli;
  while (!args.done()) {
    const std::string_view arg = args.next();
    if (arg == "--algorithm" || arg == "-a") {
      cli.algorithm = args.value(arg);
    } else if (arg == "--duration" || arg == "-d") {
      cli.duration_secs = args.number(arg);
    } else if (arg == "--threads" || arg == "-t") {
      cli.threads = static_cast<uint32_t>(args.number(arg));
    } else {
      unknown_option("benchmark", arg);
    }
  }
  if (!cli.algorithm) {
    throw rxminer::ConfigError("benchmark requires --algorithm");
  }
  if (cli.duration_secs == 0) {
    throw rxminer::ConfigError("--duration must be > 0");
  }
  if (!rxminer::apply_log_level_from_env()) {
    rxminer::set_log_level(rxminer::LogLevel::Debug);
  }

  rxminer::BenchmarkOptions options;
  options.algorithm = parse_algorithm_arg(*cli.algorithm);
  options.duration = std::chrono::seconds(cli.duration_secs);
  options.threads = cli.threads.value_or(rxminer::logical_cpu_count());
  options.placement.pin = rxminer::thread_pinning_supported();

  const rxminer::HashingConfig hashing;
  options.memory_mode = hashing.full_mem ? rxminer::MemoryMode::Fast : rxminer::MemoryMode::Light;

  install_signal_handlers();
  const auto report = rxminer::run_benchmark(options, rxminer::default_algorithm_factory(hashing), &g_interrupted);
  std::cout << rxminer::format_benchmark_report(report);
  return 0;
}

int run_config_command(ArgReader args) {
  ConfigCli cli;
  while (!args.done()) {
    const std::string_view arg = args.next();
    if (arg == "--output" || arg == "-o") {
      cli.output = args.value(arg);
    } else if (arg == "--pool" || arg == "-p") {
      cli.pool = true;
    } else if (arg == "--node" || arg == "-n") {
      cli.node = true;
    } else {
      unknown_option("config", arg);
    }
  }
  rxminer::write_config_template(cli.output, cli.pool, cli.node);
  std::cout << "Wrote config template to: " << cli.output.string() << '\n';
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  try {
    rxminer::apply_log_level_from_env();

    if (argc < 2) {
      print_usage(std::cerr);
      return 1;
    }

    const std::string_view command = argv[1];
    ArgReader args(argc, argv, 2);
    if (command == "start") {
      return run_start(args);
    }
    if (command == "benchmark") {
      return run_benchmark_command(args);
    }
    if (command == "config") {
      return run_config_command(args);
    }
    if (command == "--help" || command == "-h" || command == "help") {
      print_usage(std::cout);
      return 0;
    }
    if (command == "--version" || command == "-V") {
      std::cout << "rxminer " << RXMINER_VERSION << '\n';
      return 0;
    }
    throw rxminer::ConfigError("unknown command '" + std::string(command) + "'; see rxminer --help");
  } catch (const std::exception& ex) {
    std::cerr << "fatal: " << ex.what() << '\n';
    return 1;
  }
}
