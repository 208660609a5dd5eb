#include "rxminer/pool_job_source.hpp"

#include "rxminer/errors.hpp"
#include "rxminer/log.hpp"

#include <utility>

namespace rxminer {

namespace {

constexpr const char kStratumAgent[] = "rxminer/" RXMINER_VERSION;
constexpr uint32_t kPollIntervalMs = 100;
constexpr uint64_t kEmbeddedNonceSpace = 1ULL << 32;

} // namespace

PoolJobSource::PoolJobSource(PoolConfig config, PoolSourceLimits limits)
  : config_(std::move(config)),
    limits_(limits),
    endpoint_(parse_endpoint(config_.url)),
    client_(endpoint_, kStratumAgent) {}

PoolJobSource::~PoolJobSource() {
  stop();
}

std::string PoolJobSource::describe() const {
  return "pool " + format_endpoint(endpoint_);
}

Job PoolJobSource::to_job(uint64_t id, StratumJob job) {
  Job out;
  out.id = id;
  out.upstream_id = std::move(job.job_id);
  out.blob.bytes = std::move(job.blob);
  out.blob.nonce_offset = job.nonce_offset;
  out.blob.height = job.height;
  out.target = job.target;
  out.seed = std::move(job.seed);
  out.height = job.height;
  out.nonce_end = kEmbeddedNonceSpace;
  out.algorithm = job.algorithm;
  return out;
}

void PoolJobSource::start() {
  if (io_thread_.joinable()) {
    return;
  }
  stop_.store(false);
  io_thread_ = std::thread([this]() { io_loop(); });
}

void PoolJobSource::stop() {
  stop_.store(true);
  client_.interrupt();
  cv_.notify_all();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
}

std::optional<Job> PoolJobSource::next_job(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this]() { return !jobs_.empty() || unavailable_ || stop_.load(); });
  if (!jobs_.empty()) {
    // Only the newest job matters; older queued ones are already superseded.
    Job job = std::move(jobs_.back());
    jobs_.clear();
    return job;
  }
  if (unavailable_) {
    throw ConnectionError("job source unavailable: " + unavailable_reason_);
  }
  return std::nullopt;
}

SubmitResult PoolJobSource::submit_share(const Share& share) {
  const auto job = recent_.find(share.job_id);
  if (job == nullptr) {
    throw SubmitError("share for unknown job " + std::to_string(share.job_id));
  }

  auto pending = std::make_shared<PendingSubmit>();
  pending->upstream_job_id = job->upstream_id;
  pending->share = share;
  auto result = pending->promise.get_future();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unavailable_ || stop_.load()) {
      throw SubmitError("pool connection is closed");
    }
    outgoing_.push_back(std::move(pending));
  }

  if (result.wait_for(limits_.submit_timeout) != std::future_status::ready) {
    throw SubmitError("pool did not answer the submission in time");
  }
  return result.get();
}

bool PoolJobSource::connect_and_login(std::string* error_message) {
  try {
    client_.connect();
  } catch (const ConnectionError& e) {
    *error_message = e.what();
    return false;
  }
  if (!client_.login(config_.user, config_.password, config_.worker_id, error_message)) {
    client_.disconnect();
    return false;
  }
  next_keepalive_ = std::chrono::steady_clock::now() + std::chrono::seconds(config_.keepalive_secs);
  return true;
}

void PoolJobSource::flush_outgoing() {
  std::deque<std::shared_ptr<PendingSubmit>> batch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    batch.swap(outgoing_);
  }
  for (auto& pending : batch) {
    std::string error;
    const uint64_t id = client_.send_submit(pending->upstream_job_id, pending->share.nonce, pending->share.digest, &error);
    if (id == 0) {
      pending->promise.set_exception(std::make_exception_ptr(SubmitError(error)));
      continue;
    }
    inflight_.emplace(id, std::move(pending));
  }
}

void PoolJobSource::handle_message(StratumMessage msg) {
  switch (msg.kind) {
    case StratumMessage::Kind::Job: {
      std::lock_guard<std::mutex> lock(mutex_);
      Job job = to_job(next_job_id_++, std::move(msg.job));
      log_debug("pool", "new job " + job.upstream_id + " height " + std::to_string(job.height));
      recent_.remember(job);
      jobs_.push_back(std::move(job));
      cv_.notify_all();
      return;
    }
    case StratumMessage::Kind::Response: {
      const auto it = msg.id ? inflight_.find(*msg.id) : inflight_.end();
      if (it == inflight_.end()) {
        if (!msg.ok) {
          log_warn("pool", "request failed: " + msg.error);
        }
        return;
      }
      if (!msg.ok) {
        log_warn("pool", "share rejected: " + msg.error);
      }
      it->second->promise.set_value(msg.ok ? SubmitResult::Accepted : SubmitResult::Rejected);
      inflight_.erase(it);
      return;
    }
    case StratumMessage::Kind::Other:
      return;
  }
}

void PoolJobSource::fail_inflight(const std::string& reason) {
  for (auto& [id, pending] : inflight_) {
    pending->promise.set_exception(std::make_exception_ptr(SubmitError(reason)));
  }
  inflight_.clear();
}

void PoolJobSource::mark_unavailable(const std::string& reason) {
  std::deque<std::shared_ptr<PendingSubmit>> orphaned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    unavailable_ = true;
    unavailable_reason_ = reason;
    orphaned.swap(outgoing_);
  }
  cv_.notify_all();
  for (auto& pending : orphaned) {
    pending->promise.set_exception(std::make_exception_ptr(SubmitError(reason)));
  }
}

bool PoolJobSource::wait_backoff() {
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_for(lock, limits_.reconnect_backoff, [this]() { return stop_.load(); });
}

void PoolJobSource::io_loop() {
  uint32_t failures = 0;
  bool outage_logged = false;

  while (!stop_.load()) {
    if (!client_.connected()) {
      std::string error;
      if (!connect_and_login(&error)) {
        ++failures;
        if (!outage_logged) {
          log_warn("pool", format_endpoint(endpoint_) + " unreachable (" + error + "), retrying");
          outage_logged = true;
        }
        if (failures >= limits_.max_connect_failures) {
          log_error("pool", "giving up after " + std::to_string(failures) + " attempts, stopped");
          mark_unavailable(error);
          break;
        }
        if (!wait_backoff()) {
          break;
        }
        continue;
      }
      log_info("pool", "logged in to " + format_endpoint(endpoint_));
      failures = 0;
      outage_logged = false;
    }

    flush_outgoing();

    std::string error;
    const auto now = std::chrono::steady_clock::now();
    if (config_.keepalive_secs > 0 && now >= next_keepalive_) {
      next_keepalive_ = now + std::chrono::seconds(config_.keepalive_secs);
      if (!client_.send_keepalive(&error)) {
        log_warn("pool", error + ", retrying");
        fail_inflight(error);
        client_.disconnect();
        outage_logged = true;
        continue;
      }
    }

    StratumMessage msg;
    if (!client_.poll(&msg, kPollIntervalMs, &error)) {
      if (error.empty()) {
        continue;
      }
      if (!stop_.load()) {
        log_warn("pool", "connection lost (" + error + "), retrying");
        outage_logged = true;
      }
      fail_inflight(error);
      client_.disconnect();
      continue;
    }
    handle_message(std::move(msg));
  }

  fail_inflight("pool connection closed");
  client_.disconnect();
  std::deque<std::shared_ptr<PendingSubmit>> orphaned;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    orphaned.swap(outgoing_);
  }
  for (auto& pending : orphaned) {
    pending->promise.set_exception(std::make_exception_ptr(SubmitError("pool connection closed")));
  }
}

} // namespace rxminer
