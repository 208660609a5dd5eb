#pragma once

#include "rxminer/algorithm.hpp"
#include "rxminer/perf.hpp"
#include "rxminer/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

namespace rxminer {

class Scheduler;
struct Assignment;

enum class WorkerState {
  Idle,
  Hashing,
  ShareFound,
  RangeExhausted,
  StaleJob,
  Stopped,
};

const char* worker_state_name(WorkerState state);

// One persistent hashing thread. Pulls ranges of the scheduler's current job,
// hashes them with its private engine and reports progress and shares.
class WorkerUnit {
public:
  WorkerUnit(uint32_t index, Scheduler& scheduler, ThreadPlacement placement);
  ~WorkerUnit();

  WorkerUnit(const WorkerUnit&) = delete;
  WorkerUnit& operator=(const WorkerUnit&) = delete;

  void start(uint32_t worker_count);
  // Asks the unit to stop at its next control check. Does not join.
  void request_stop();
  void join();

  uint32_t index() const { return index_; }
  WorkerState state() const { return state_.load(std::memory_order_relaxed); }
  uint64_t hashes() const { return hashes_.load(std::memory_order_relaxed); }
  uint64_t faults() const { return faults_.load(std::memory_order_relaxed); }
  bool stop_requested() const { return stop_.load(std::memory_order_relaxed); }

private:
  void run(uint32_t worker_count);
  void step();
  // Abandons the range once the job or the published assignment moves on.
  void hash_range(const Assignment& work, uint64_t version, const NonceRange& range, uint64_t* done);
  void flush_progress(uint64_t done);

  uint32_t index_;
  Scheduler& scheduler_;
  ThreadPlacement placement_;
  std::thread thread_;

  std::atomic<bool> stop_{false};
  std::atomic<WorkerState> state_{WorkerState::Idle};
  std::atomic<uint64_t> hashes_{0};
  std::atomic<uint64_t> faults_{0};

  std::unique_ptr<HashEngine> engine_;
  std::shared_ptr<const AlgorithmContext> engine_context_;
  uint64_t cached_job_id_ = 0;
  uint64_t observed_generation_ = 0;
};

} // namespace rxminer
