#pragma once

#include "rxminer/perf.hpp"
#include "rxminer/scheduler.hpp"
#include "rxminer/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace rxminer {

struct BenchmarkOptions {
  AlgorithmKind algorithm = AlgorithmKind::RandomX;
  std::chrono::milliseconds duration{std::chrono::seconds(60)};
  // 0 uses every logical CPU.
  uint32_t threads = 0;
  uint32_t batch_size = 1000;
  MemoryMode memory_mode = MemoryMode::Fast;
  ThreadPlacement placement;
  std::chrono::milliseconds stats_interval{std::chrono::seconds(5)};
  std::chrono::milliseconds ready_timeout{std::chrono::minutes(10)};
};

struct BenchmarkReport {
  AlgorithmKind algorithm = AlgorithmKind::RandomX;
  uint32_t threads = 0;
  uint64_t total_hashes = 0;
  double elapsed_seconds = 0.0;
  double average_hashrate = 0.0;
  std::vector<uint64_t> per_thread_hashes;
};

// Hashes a synthetic job that never meets its target for the configured
// duration. The clock starts once the algorithm context is ready. Setting
// *interrupt ends the run early.
BenchmarkReport run_benchmark(
  const BenchmarkOptions& options,
  const AlgorithmFactory& factory,
  const std::atomic<bool>* interrupt = nullptr);

std::string format_benchmark_report(const BenchmarkReport& report);

} // namespace rxminer
