#include "rxminer/benchmark.hpp"

#include "rxminer/errors.hpp"
#include "rxminer/job_source.hpp"
#include "rxminer/log.hpp"
#include "rxminer/stats.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <thread>

namespace rxminer {

namespace {

constexpr auto kProgressInterval = std::chrono::seconds(1);
constexpr auto kPollInterval = std::chrono::milliseconds(50);

} // namespace

BenchmarkReport run_benchmark(
  const BenchmarkOptions& options,
  const AlgorithmFactory& factory,
  const std::atomic<bool>* interrupt) {
  using clock = std::chrono::steady_clock;

  BenchmarkReport report;
  report.algorithm = options.algorithm;
  report.threads = options.threads != 0 ? options.threads : logical_cpu_count();

  StatsOptions stats_options;
  stats_options.report_interval = options.stats_interval;
  stats_options.hashrate_window = options.stats_interval;
  stats_options.periodic_summaries = false;
  StatsAggregator stats(stats_options);
  stats.start();

  SyntheticJobSource source(options.algorithm);
  SchedulerOptions scheduler_options;
  scheduler_options.batch_size = options.batch_size;
  scheduler_options.memory_mode = options.memory_mode;
  scheduler_options.placement = options.placement;
  Scheduler scheduler(scheduler_options, options.algorithm, factory, stats.channel(), source);

  auto job = source.next_job(std::chrono::milliseconds(0));
  if (!job || !scheduler.install_job(std::move(*job))) {
    throw MinerError("benchmark job could not be installed");
  }

  log_info("benchmark", std::string("preparing ") + algorithm_name(options.algorithm) + " context");
  if (!scheduler.wait_until_ready(options.ready_timeout)) {
    scheduler.rethrow_if_failed();
    throw ContextInitError("algorithm context was not ready in time");
  }

  log_info(
    "benchmark",
    "running " + std::to_string(report.threads) + " thread(s) for " +
      std::to_string(std::chrono::duration_cast<std::chrono::seconds>(options.duration).count()) + "s");
  const auto started = clock::now();
  scheduler.set_thread_count(report.threads);

  const auto deadline = started + options.duration;
  auto next_progress = started + kProgressInterval;
  std::vector<uint64_t> last_counts(report.threads, 0);
  auto last_progress = started;

  while (clock::now() < deadline) {
    if (interrupt != nullptr && interrupt->load(std::memory_order_relaxed)) {
      log_info("benchmark", "interrupted, reporting partial results");
      break;
    }
    scheduler.rethrow_if_failed();
    std::this_thread::sleep_until(std::min({deadline, next_progress, clock::now() + kPollInterval}));

    const auto now = clock::now();
    if (now >= next_progress) {
      const double seconds = std::chrono::duration<double>(now - last_progress).count();
      const auto counts = scheduler.worker_hash_counts();
      for (size_t i = 0; i < counts.size() && i < last_counts.size(); ++i) {
        const double rate = seconds > 0.0 ? static_cast<double>(counts[i] - last_counts[i]) / seconds : 0.0;
        std::ostringstream line;
        line << "Thread " << i << ": " << std::fixed << std::setprecision(2) << rate << " H/s";
        log_debug("benchmark", line.str());
        last_counts[i] = counts[i];
      }
      last_progress = now;
      next_progress = now + kProgressInterval;
    }
  }

  scheduler.stop();
  const auto finished = clock::now();
  stats.stop();
  const MiningStats summary = stats.emit_summary();

  report.total_hashes = summary.total_hashes;
  report.per_thread_hashes = scheduler.worker_hash_counts();
  report.elapsed_seconds = std::chrono::duration<double>(finished - started).count();
  report.average_hashrate = report.elapsed_seconds > 0.0
    ? static_cast<double>(report.total_hashes) / report.elapsed_seconds
    : 0.0;
  return report;
}

std::string format_benchmark_report(const BenchmarkReport& report) {
  std::ostringstream out;
  out << "Benchmark results:\n"
      << "Total hashes: " << report.total_hashes << '\n'
      << "Average hashrate: " << std::fixed << std::setprecision(2) << report.average_hashrate << " H/s\n";
  return out.str();
}

} // namespace rxminer
