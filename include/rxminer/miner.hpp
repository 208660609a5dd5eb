#pragma once

#include "rxminer/config.hpp"
#include "rxminer/job_source.hpp"
#include "rxminer/scheduler.hpp"
#include "rxminer/stats.hpp"

#include <atomic>
#include <chrono>
#include <memory>

namespace rxminer {

std::unique_ptr<JobSource> make_job_source(const Config& config);
AlgorithmFactory default_algorithm_factory(const HashingConfig& config);

// Wires a job source to the scheduler, the stats aggregator and the hardware
// monitor, and runs until request_stop() or a fatal error.
class Miner {
public:
  explicit Miner(Config config);
  Miner(Config config, std::unique_ptr<JobSource> source, AlgorithmFactory factory);

  Miner(const Miner&) = delete;
  Miner& operator=(const Miner&) = delete;

  // Async-signal-safe.
  void request_stop();
  // Throws the error that ended mining: ConnectionError when the job source
  // is gone, ContextInitError when no context can be built.
  void run();

  MiningStats last_stats() const { return last_stats_; }

private:
  Config config_;
  std::unique_ptr<JobSource> source_;
  AlgorithmFactory factory_;
  std::atomic<bool> stop_{false};
  MiningStats last_stats_;
};

} // namespace rxminer
