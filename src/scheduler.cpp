#include "rxminer/scheduler.hpp"

#include "rxminer/errors.hpp"
#include "rxminer/log.hpp"

#include <algorithm>
#include <new>

namespace rxminer {

Scheduler::Scheduler(
  SchedulerOptions options,
  AlgorithmKind initial_algorithm,
  AlgorithmFactory factory,
  StatsChannel& stats,
  JobSource& source)
  : options_(options),
    factory_(std::move(factory)),
    stats_(stats),
    source_(source),
    allocator_(options.batch_size) {
  algorithm_ = factory_(initial_algorithm);
  if (!algorithm_) {
    throw ContextInitError(std::string("no implementation for ") + algorithm_name(initial_algorithm));
  }
  builder_thread_ = std::thread([this]() { builder_loop(); });
  dispatcher_thread_ = std::thread([this]() { dispatcher_loop(); });
}

Scheduler::~Scheduler() {
  stop();
}

bool Scheduler::install_job(Job job) {
  if (stopping()) {
    return false;
  }
  const uint64_t id = job.id;
  auto shared = std::make_shared<const Job>(std::move(job));

  {
    std::lock_guard<std::mutex> share_lock(share_mutex_);
    if (id <= current_job_id_.load(std::memory_order_relaxed)) {
      log_debug("scheduler", "ignoring job " + std::to_string(id) + ", not newer than current");
      return false;
    }
    allocator_.begin_job(id, shared->nonce_start, shared->nonce_end);
    current_job_id_.store(id, std::memory_order_release);
    share_queue_.erase(
      std::remove_if(share_queue_.begin(), share_queue_.end(), [id](const Share& s) { return s.job_id < id; }),
      share_queue_.end());
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!latest_job_ || latest_job_->id < id) {
      latest_job_ = shared;
      publish_locked();
    }
  }

  log_info(
    "scheduler",
    "new job " + std::to_string(id) +
      (shared->upstream_id.empty() ? "" : " (" + shared->upstream_id + ")") +
      " height " + std::to_string(shared->height) +
      " diff " + std::to_string(shared->target.saturated_difficulty()));
  return true;
}

void Scheduler::set_algorithm(AlgorithmKind kind) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (algorithm_->kind() == kind) {
    return;
  }
  auto next = factory_(kind);
  if (!next) {
    throw ContextInitError(std::string("no implementation for ") + algorithm_name(kind));
  }
  log_info("scheduler", std::string("switching algorithm to ") + algorithm_name(kind));
  algorithm_ = std::move(next);
  publish_locked();
}

AlgorithmKind Scheduler::algorithm() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return algorithm_->kind();
}

void Scheduler::set_thread_count(uint32_t count) {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  if (stopping()) {
    return;
  }

  while (workers_.size() < count) {
    const auto index = static_cast<uint32_t>(workers_.size());
    auto worker = std::make_unique<WorkerUnit>(index, *this, options_.placement);
    worker->start(count);
    workers_.push_back(std::move(worker));
  }

  if (workers_.size() > count) {
    for (size_t i = count; i < workers_.size(); ++i) {
      workers_[i]->request_stop();
    }
    {
      std::lock_guard<std::mutex> work_lock(work_mutex_);
      ++work_generation_;
    }
    work_cv_.notify_all();
    for (size_t i = count; i < workers_.size(); ++i) {
      workers_[i]->join();
      if (retired_hashes_.size() <= i) {
        retired_hashes_.resize(i + 1, 0);
      }
      retired_hashes_[i] += workers_[i]->hashes();
    }
    workers_.resize(count);
  }

  log_info("scheduler", "running " + std::to_string(count) + " worker thread(s)");
}

uint32_t Scheduler::thread_count() const {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  return static_cast<uint32_t>(workers_.size());
}

std::vector<uint64_t> Scheduler::worker_hash_counts() const {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  std::vector<uint64_t> out(std::max(workers_.size(), retired_hashes_.size()), 0);
  for (size_t i = 0; i < retired_hashes_.size(); ++i) {
    out[i] += retired_hashes_[i];
  }
  for (size_t i = 0; i < workers_.size(); ++i) {
    out[i] += workers_[i]->hashes();
  }
  return out;
}

uint64_t Scheduler::worker_faults() const {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  uint64_t total = 0;
  for (const auto& worker : workers_) {
    total += worker->faults();
  }
  return total;
}

std::shared_ptr<const AlgorithmContext> Scheduler::active_context() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return context_;
}

void Scheduler::stop() {
  if (stopping_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  { std::lock_guard<std::mutex> lock(state_mutex_); }
  state_cv_.notify_all();
  {
    std::lock_guard<std::mutex> lock(work_mutex_);
    ++work_generation_;
  }
  work_cv_.notify_all();
  { std::lock_guard<std::mutex> lock(share_mutex_); }
  share_cv_.notify_all();

  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto& worker : workers_) {
      worker->request_stop();
    }
    for (auto& worker : workers_) {
      worker->join();
    }
  }

  if (builder_thread_.joinable()) {
    builder_thread_.join();
  }
  if (dispatcher_thread_.joinable()) {
    dispatcher_thread_.join();
  }
  assignment_.store(nullptr, std::memory_order_release);
}

bool Scheduler::wait_until_ready(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(state_mutex_);
  state_cv_.wait_for(lock, timeout, [this]() {
    return stopping() || fatal_error_ != nullptr || assignment_.load(std::memory_order_acquire) != nullptr;
  });
  return assignment_.load(std::memory_order_acquire) != nullptr;
}

std::exception_ptr Scheduler::fatal_error() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return fatal_error_;
}

void Scheduler::rethrow_if_failed() const {
  if (const auto error = fatal_error()) {
    std::rethrow_exception(error);
  }
}

uint64_t Scheduler::work_generation() const {
  std::lock_guard<std::mutex> lock(work_mutex_);
  return work_generation_;
}

void Scheduler::wait_for_work(uint64_t observed_generation, const std::atomic<bool>& worker_stop) {
  std::unique_lock<std::mutex> lock(work_mutex_);
  work_cv_.wait(lock, [&]() {
    return work_generation_ != observed_generation ||
           stopping() ||
           worker_stop.load(std::memory_order_relaxed);
  });
}

bool Scheduler::emit_share(const Share& share) {
  {
    std::lock_guard<std::mutex> lock(share_mutex_);
    if (stopping() || share.job_id != current_job_id_.load(std::memory_order_acquire)) {
      return false;
    }
    share_queue_.push_back(share);
  }
  share_cv_.notify_one();
  log_info("scheduler", "share found for job " + std::to_string(share.job_id) + " nonce " + std::to_string(share.nonce));
  return true;
}

void Scheduler::report_fault(const WorkerFault& fault) {
  log_warn("scheduler", std::string(fault.what()) + ", restarting unit with a fresh engine");
}

void Scheduler::report_channel_failure(std::exception_ptr error) {
  if (stopping()) {
    return;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  fail_locked(std::move(error));
}

void Scheduler::publish_locked() {
  std::shared_ptr<const Assignment> next;
  if (latest_job_) {
    ContextKey desired{algorithm_->kind(), latest_job_->seed};
    if (context_ && context_key_ == desired) {
      next = std::make_shared<const Assignment>(Assignment{latest_job_, context_});
    } else {
      // Workers drop their engines once they see no assignment, so the old context can go now.
      context_.reset();
      context_key_.reset();
      if (building_key_ == desired) {
        pending_build_.reset();
      } else if (!pending_build_ || !(pending_build_->key == desired)) {
        pending_build_ = BuildRequest{std::move(desired), algorithm_};
      }
    }
  }

  assignment_.store(std::move(next), std::memory_order_release);
  assignment_version_.fetch_add(1, std::memory_order_release);
  {
    std::lock_guard<std::mutex> lock(work_mutex_);
    ++work_generation_;
  }
  work_cv_.notify_all();
  state_cv_.notify_all();
}

void Scheduler::builder_loop() {
  while (true) {
    BuildRequest request;
    {
      std::unique_lock<std::mutex> lock(state_mutex_);
      state_cv_.wait(lock, [this]() { return stopping() || pending_build_.has_value(); });
      if (stopping()) {
        return;
      }
      request = std::move(*pending_build_);
      pending_build_.reset();
      building_key_ = request.key;
    }

    log_info("scheduler", std::string("building ") + algorithm_name(request.key.kind) + " context");
    std::shared_ptr<const AlgorithmContext> built;
    std::exception_ptr error;
    try {
      built = request.algorithm->build_context(request.key.seed, options_.memory_mode);
    } catch (const ContextInitError&) {
      error = std::current_exception();
    } catch (const std::bad_alloc&) {
      error = std::make_exception_ptr(ContextInitError("out of memory while building algorithm context"));
    } catch (const std::exception& e) {
      error = std::make_exception_ptr(ContextInitError(e.what()));
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    building_key_.reset();
    if (error) {
      fail_locked(error);
      continue;
    }
    contexts_built_.fetch_add(1, std::memory_order_relaxed);
    context_ = std::move(built);
    context_key_ = std::move(request.key);
    publish_locked();
  }
}

void Scheduler::dispatcher_loop() {
  while (true) {
    Share share;
    {
      std::unique_lock<std::mutex> lock(share_mutex_);
      share_cv_.wait(lock, [this]() { return stopping() || !share_queue_.empty(); });
      if (stopping()) {
        if (!share_queue_.empty()) {
          log_debug("scheduler", "dropping " + std::to_string(share_queue_.size()) + " unsent share(s) at shutdown");
        }
        return;
      }
      share = share_queue_.front();
      share_queue_.pop_front();
      if (share.job_id != current_job_id_.load(std::memory_order_acquire)) {
        log_debug("scheduler", "dropping share for superseded job " + std::to_string(share.job_id));
        continue;
      }
    }

    ShareResult result;
    result.job_id = share.job_id;
    try {
      const bool accepted = source_.submit_share(share) == SubmitResult::Accepted;
      result.outcome = accepted ? ShareOutcome::Accepted : ShareOutcome::Rejected;
      if (accepted) {
        log_info("scheduler", "share accepted");
      } else {
        log_warn("scheduler", "share rejected by " + source_.describe());
      }
    } catch (const std::exception& e) {
      result.outcome = ShareOutcome::Rejected;
      log_warn("scheduler", std::string("share submission failed: ") + e.what() + " (mining continues)");
    }

    try {
      stats_.send(result);
    } catch (const ChannelError&) {
      std::lock_guard<std::mutex> lock(state_mutex_);
      fail_locked(std::current_exception());
      return;
    }
  }
}

void Scheduler::fail_locked(std::exception_ptr error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    log_error("scheduler", std::string(e.what()) + ", mining stopped");
  }
  if (!fatal_error_) {
    fatal_error_ = error;
  }
  state_cv_.notify_all();
}

} // namespace rxminer
