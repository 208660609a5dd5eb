#include "rxminer/miner.hpp"

#include "rxminer/errors.hpp"
#include "rxminer/hardware.hpp"
#include "rxminer/log.hpp"
#include "rxminer/node_job_source.hpp"
#include "rxminer/pool_job_source.hpp"

#include <utility>

namespace rxminer {

namespace {

constexpr auto kJobPollTimeout = std::chrono::milliseconds(500);

} // namespace

std::unique_ptr<JobSource> make_job_source(const Config& config) {
  if (config.pool) {
    return std::make_unique<PoolJobSource>(*config.pool);
  }
  if (config.node) {
    return std::make_unique<NodeJobSource>(*config.node);
  }
  throw ConfigError("config needs a mining mode: add mode.pool or mode.node");
}

AlgorithmFactory default_algorithm_factory(const HashingConfig& config) {
  return [config](AlgorithmKind kind) { return make_algorithm(kind, config); };
}

Miner::Miner(Config config)
  : config_(std::move(config)),
    source_(make_job_source(config_)),
    factory_(default_algorithm_factory(config_.randomx)) {}

Miner::Miner(Config config, std::unique_ptr<JobSource> source, AlgorithmFactory factory)
  : config_(std::move(config)),
    source_(std::move(source)),
    factory_(std::move(factory)) {}

void Miner::request_stop() {
  stop_.store(true, std::memory_order_relaxed);
}

void Miner::run() {
  const AlgorithmKind algorithm = configured_algorithm(config_);
  const auto stats_interval = std::chrono::seconds(config_.general.stats_interval_secs);

  StatsOptions stats_options;
  stats_options.report_interval = stats_interval;
  stats_options.hashrate_window = std::chrono::seconds(config_.general.hashrate_window_secs);
  StatsAggregator stats(stats_options);
  stats.start();

  HardwareMonitor hardware(stats.channel(), stats_interval);
  hardware.start();

  SchedulerOptions scheduler_options;
  scheduler_options.batch_size = config_.general.batch_size;
  scheduler_options.memory_mode = config_.randomx.full_mem ? MemoryMode::Fast : MemoryMode::Light;
  scheduler_options.placement.pin = config_.tuning.pin_threads;
  scheduler_options.placement.numa_bind = config_.tuning.numa_bind;
  scheduler_options.placement.batch_priority = true;
  Scheduler scheduler(scheduler_options, algorithm, factory_, stats.channel(), *source_);

  const uint32_t threads = config_.general.worker_threads != 0 ? config_.general.worker_threads : recommended_mining_threads();
  log_info(
    "miner",
    "mining " + std::string(algorithm_name(algorithm)) + " with " + std::to_string(threads) +
      " thread(s) via " + source_->describe());
  scheduler.set_thread_count(threads);

  auto shutdown = [&]() {
    source_->stop();
    scheduler.stop();
    hardware.stop();
    stats.stop();
    last_stats_ = stats.emit_summary();
  };

  try {
    source_->start();
    while (!stop_.load(std::memory_order_relaxed)) {
      scheduler.rethrow_if_failed();
      auto job = source_->next_job(kJobPollTimeout);
      if (!job) {
        continue;
      }
      if (job->algorithm && *job->algorithm != scheduler.algorithm()) {
        log_info("miner", std::string("job requests ") + algorithm_name(*job->algorithm) + ", switching");
        scheduler.set_algorithm(*job->algorithm);
      }
      const uint64_t id = job->id;
      const uint64_t height = job->height;
      if (scheduler.install_job(std::move(*job))) {
        log_info("miner", "new job " + std::to_string(id) + " height " + std::to_string(height));
      } else {
        log_debug("miner", "ignoring out-of-order job " + std::to_string(id));
      }
    }
    log_info("miner", "stopping");
  } catch (const std::exception& e) {
    log_error("miner", std::string(e.what()) + ", stopped");
    shutdown();
    throw;
  }
  shutdown();
}

} // namespace rxminer
