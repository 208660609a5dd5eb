#include "rxminer/worker.hpp"

#include "rxminer/errors.hpp"
#include "rxminer/log.hpp"
#include "rxminer/scheduler.hpp"

#include <chrono>
#include <exception>

namespace rxminer {

namespace {

constexpr uint32_t kHotLoopControlCheckInterval = 8;
constexpr std::chrono::milliseconds kFaultBackoff{100};

} // namespace

const char* worker_state_name(WorkerState state) {
  switch (state) {
    case WorkerState::Idle: return "idle";
    case WorkerState::Hashing: return "hashing";
    case WorkerState::ShareFound: return "share-found";
    case WorkerState::RangeExhausted: return "range-exhausted";
    case WorkerState::StaleJob: return "stale-job";
    case WorkerState::Stopped: return "stopped";
  }
  return "unknown";
}

WorkerUnit::WorkerUnit(uint32_t index, Scheduler& scheduler, ThreadPlacement placement)
  : index_(index),
    scheduler_(scheduler),
    placement_(placement) {}

WorkerUnit::~WorkerUnit() {
  request_stop();
  join();
}

void WorkerUnit::start(uint32_t worker_count) {
  thread_ = std::thread([this, worker_count]() { run(worker_count); });
}

void WorkerUnit::request_stop() {
  stop_.store(true, std::memory_order_relaxed);
}

void WorkerUnit::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void WorkerUnit::run(uint32_t worker_count) {
  const auto placed = place_current_thread(index_, worker_count, placement_);
  if (placement_.pin) {
    log_debug(
      "worker",
      "worker " + std::to_string(index_) +
        (placed.pinned ? " pinned to cpu " + std::to_string(placed.os_cpu) : " could not be pinned"));
  }

  while (!stop_.load(std::memory_order_relaxed) && !scheduler_.stopping()) {
    try {
      step();
    } catch (const JobStaleError&) {
      state_.store(WorkerState::StaleJob, std::memory_order_relaxed);
      scheduler_.wait_for_work(observed_generation_, stop_);
    } catch (const ChannelError& e) {
      if (!scheduler_.stopping()) {
        log_error("worker", "worker " + std::to_string(index_) + " stopped: " + e.what());
        scheduler_.report_channel_failure(std::current_exception());
      }
      break;
    } catch (const std::exception& e) {
      faults_.fetch_add(1, std::memory_order_relaxed);
      engine_.reset();
      engine_context_.reset();
      scheduler_.report_fault(WorkerFault(index_, e.what()));
      std::this_thread::sleep_for(kFaultBackoff);
    }
  }

  engine_.reset();
  engine_context_.reset();
  state_.store(WorkerState::Stopped, std::memory_order_relaxed);
}

void WorkerUnit::step() {
  observed_generation_ = scheduler_.work_generation();
  const uint64_t version = scheduler_.assignment_version();
  const auto work = scheduler_.assignment();
  if (!work) {
    // Release the old context while the next one is being built.
    state_.store(WorkerState::Idle, std::memory_order_relaxed);
    engine_.reset();
    engine_context_.reset();
    scheduler_.wait_for_work(observed_generation_, stop_);
    return;
  }

  const uint64_t job_id = work->job->id;
  if (job_id != cached_job_id_) {
    cached_job_id_ = job_id;
    log_debug("worker", "worker " + std::to_string(index_) + " switched to job " + std::to_string(job_id));
  }
  if (!engine_ || engine_context_ != work->context) {
    engine_.reset();
    engine_ = work->context->new_engine();
    engine_context_ = work->context;
  }

  if (scheduler_.current_job_id() != job_id) {
    throw JobStaleError(job_id);
  }
  const auto range = scheduler_.allocator().next_range(job_id);
  if (!range) {
    if (scheduler_.allocator().current_job_id() != job_id) {
      throw JobStaleError(job_id);
    }
    state_.store(WorkerState::RangeExhausted, std::memory_order_relaxed);
    scheduler_.wait_for_work(observed_generation_, stop_);
    return;
  }

  state_.store(WorkerState::Hashing, std::memory_order_relaxed);
  uint64_t done = 0;
  try {
    hash_range(*work, version, *range, &done);
  } catch (...) {
    flush_progress(done);
    throw;
  }
  flush_progress(done);
}

void WorkerUnit::hash_range(const Assignment& work, uint64_t version, const NonceRange& range, uint64_t* done) {
  const Job& job = *work.job;
  HashEngine& engine = *engine_;

  for (uint32_t i = 0; i < range.count; ++i) {
    if ((i % kHotLoopControlCheckInterval) == 0 &&
        (stop_.load(std::memory_order_relaxed) ||
         scheduler_.stopping() ||
         scheduler_.current_job_id() != job.id ||
         scheduler_.assignment_version() != version)) {
      return;
    }

    const uint64_t nonce = range.start + i;
    const Digest digest = engine.hash(job.blob, nonce);
    ++*done;

    if (engine.verify(digest, job.target)) {
      state_.store(WorkerState::ShareFound, std::memory_order_relaxed);
      if (scheduler_.current_job_id() == job.id) {
        Share share;
        share.job_id = job.id;
        share.nonce = nonce;
        share.digest = digest;
        scheduler_.emit_share(share);
      }
      state_.store(WorkerState::Hashing, std::memory_order_relaxed);
    }
  }
}

void WorkerUnit::flush_progress(uint64_t done) {
  if (done == 0) {
    return;
  }
  hashes_.fetch_add(done, std::memory_order_relaxed);
  ProgressDelta delta;
  delta.worker_index = index_;
  delta.hashes = done;
  scheduler_.stats().send(delta);
}

} // namespace rxminer
