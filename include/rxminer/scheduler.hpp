#pragma once

#include "rxminer/algorithm.hpp"
#include "rxminer/job_source.hpp"
#include "rxminer/nonce_allocator.hpp"
#include "rxminer/perf.hpp"
#include "rxminer/stats.hpp"
#include "rxminer/types.hpp"
#include "rxminer/worker.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace rxminer {

class WorkerFault;

// What a worker needs to hash: the current job and the context built for it.
struct Assignment {
  std::shared_ptr<const Job> job;
  std::shared_ptr<const AlgorithmContext> context;
};

using AlgorithmFactory = std::function<std::unique_ptr<Algorithm>(AlgorithmKind)>;

struct SchedulerOptions {
  uint32_t batch_size = 1000;
  MemoryMode memory_mode = MemoryMode::Fast;
  ThreadPlacement placement;
};

// Owns the job lifecycle, the worker units and the algorithm context. Jobs are
// published to workers with an atomic shared_ptr swap; contexts are built on a
// dedicated thread so the hot loop never blocks on initialization.
class Scheduler {
public:
  Scheduler(
    SchedulerOptions options,
    AlgorithmKind initial_algorithm,
    AlgorithmFactory factory,
    StatsChannel& stats,
    JobSource& source);
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Returns false when job.id is not above the current id.
  bool install_job(Job job);
  void set_thread_count(uint32_t count);
  void set_algorithm(AlgorithmKind kind);
  void stop();

  AlgorithmKind algorithm() const;
  uint32_t thread_count() const;
  uint64_t current_job_id() const { return current_job_id_.load(std::memory_order_acquire); }
  uint64_t contexts_built() const { return contexts_built_.load(std::memory_order_relaxed); }
  std::vector<uint64_t> worker_hash_counts() const;
  uint64_t worker_faults() const;
  std::shared_ptr<const AlgorithmContext> active_context() const;

  // Waits until workers have both a job and a ready context.
  bool wait_until_ready(std::chrono::milliseconds timeout);
  // Set when the context for the configured algorithm cannot be built.
  std::exception_ptr fatal_error() const;
  void rethrow_if_failed() const;

  // Worker-facing interface.
  std::shared_ptr<const Assignment> assignment() const { return assignment_.load(std::memory_order_acquire); }
  // Bumped after every publication, including a context swap for the same job.
  uint64_t assignment_version() const { return assignment_version_.load(std::memory_order_acquire); }
  uint64_t work_generation() const;
  void wait_for_work(uint64_t observed_generation, const std::atomic<bool>& worker_stop);
  NonceAllocator& allocator() { return allocator_; }
  StatsChannel& stats() { return stats_; }
  bool emit_share(const Share& share);
  void report_fault(const WorkerFault& fault);
  // A closed stats channel halts mining: recorded as fatal_error().
  void report_channel_failure(std::exception_ptr error);
  bool stopping() const { return stopping_.load(std::memory_order_acquire); }

private:
  struct ContextKey {
    AlgorithmKind kind = AlgorithmKind::RandomX;
    std::vector<uint8_t> seed;

    bool operator==(const ContextKey& other) const = default;
  };

  struct BuildRequest {
    ContextKey key;
    std::shared_ptr<const Algorithm> algorithm;
  };

  void publish_locked();
  void builder_loop();
  void dispatcher_loop();
  // Caller holds state_mutex_.
  void fail_locked(std::exception_ptr error);

  SchedulerOptions options_;
  AlgorithmFactory factory_;
  StatsChannel& stats_;
  JobSource& source_;
  NonceAllocator allocator_;

  std::atomic<std::shared_ptr<const Assignment>> assignment_;
  std::atomic<uint64_t> current_job_id_{0};
  std::atomic<uint64_t> assignment_version_{0};
  std::atomic<uint64_t> contexts_built_{0};
  std::atomic<bool> stopping_{false};

  // Job, algorithm and context state; guarded by state_mutex_.
  mutable std::mutex state_mutex_;
  std::condition_variable state_cv_;
  std::shared_ptr<const Algorithm> algorithm_;
  std::shared_ptr<const Job> latest_job_;
  std::shared_ptr<const AlgorithmContext> context_;
  std::optional<ContextKey> context_key_;
  std::optional<BuildRequest> pending_build_;
  std::optional<ContextKey> building_key_;
  std::exception_ptr fatal_error_;

  mutable std::mutex work_mutex_;
  std::condition_variable work_cv_;
  uint64_t work_generation_ = 0;

  mutable std::mutex workers_mutex_;
  std::vector<std::unique_ptr<WorkerUnit>> workers_;
  std::vector<uint64_t> retired_hashes_;

  // Guards the share queue and the current job id check made when a share is
  // queued and again just before it is submitted. Never held across submit_share().
  std::mutex share_mutex_;
  std::condition_variable share_cv_;
  std::deque<Share> share_queue_;

  std::thread builder_thread_;
  std::thread dispatcher_thread_;
};

} // namespace rxminer
