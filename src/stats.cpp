#include "rxminer/stats.hpp"

#include "rxminer/errors.hpp"
#include "rxminer/log.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace rxminer {

namespace {

constexpr auto kSampleInterval = std::chrono::seconds(1);

std::string format_bytes(uint64_t bytes) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2);
  const double gib = static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0);
  if (gib >= 1.0) {
    oss << gib << " GiB";
  } else {
    oss << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MiB";
  }
  return oss.str();
}

} // namespace

void StatsChannel::send(StatsEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      throw ChannelError("stats channel is closed");
    }
    queue_.push_back(std::move(event));
  }
  cv_.notify_one();
}

bool StatsChannel::receive_until(std::chrono::steady_clock::time_point deadline, std::vector<StatsEvent>* out) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_until(lock, deadline, [this]() { return closed_ || !queue_.empty(); });
  const bool drained_and_closed = closed_ && queue_.empty();
  while (!queue_.empty()) {
    out->push_back(std::move(queue_.front()));
    queue_.pop_front();
  }
  return !drained_and_closed;
}

void StatsChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool StatsChannel::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

StatsAggregator::StatsAggregator(StatsOptions options)
  : options_(std::move(options)),
    started_at_(std::chrono::steady_clock::now()) {}

StatsAggregator::~StatsAggregator() {
  stop();
}

void StatsAggregator::start() {
  if (thread_.joinable()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    started_at_ = std::chrono::steady_clock::now();
    samples_.clear();
    samples_.emplace_back(started_at_, total_hashes_);
  }
  thread_ = std::thread([this]() { run(); });
}

void StatsAggregator::stop() {
  channel_.close();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void StatsAggregator::run() {
  using clock = std::chrono::steady_clock;
  auto next_sample = clock::now() + kSampleInterval;
  auto next_report = clock::now() + options_.report_interval;
  std::vector<StatsEvent> batch;

  while (true) {
    batch.clear();
    const auto deadline = std::min(next_sample, next_report);
    const bool open = channel_.receive_until(deadline, &batch);
    for (const auto& event : batch) {
      apply(event);
    }

    const auto now = clock::now();
    if (now >= next_sample) {
      sample_hashrate(now);
      next_sample = now + kSampleInterval;
    }
    if (now >= next_report) {
      if (options_.periodic_summaries) {
        emit_summary();
      }
      next_report = now + options_.report_interval;
    }
    if (!open) {
      break;
    }
  }
  sample_hashrate(clock::now());
}

void StatsAggregator::apply(const StatsEvent& event) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (const auto* progress = std::get_if<ProgressDelta>(&event)) {
    total_hashes_ += progress->hashes;
    if (per_worker_hashes_.size() <= progress->worker_index) {
      per_worker_hashes_.resize(static_cast<size_t>(progress->worker_index) + 1U, 0);
    }
    per_worker_hashes_[progress->worker_index] += progress->hashes;
  } else if (const auto* result = std::get_if<ShareResult>(&event)) {
    if (result->outcome == ShareOutcome::Accepted) {
      ++accepted_;
    } else {
      ++rejected_;
    }
  } else if (const auto* hardware = std::get_if<HardwareSnapshot>(&event)) {
    hardware_ = *hardware;
  }
}

void StatsAggregator::sample_hashrate(std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  samples_.emplace_back(now, total_hashes_);
  const auto max_age = options_.hashrate_window + options_.hashrate_window / 2;
  while (samples_.size() > 1 && (now - samples_.front().first) > max_age) {
    samples_.pop_front();
  }

  auto reference = samples_.front();
  for (auto it = samples_.rbegin(); it != samples_.rend(); ++it) {
    if ((now - it->first) >= options_.hashrate_window) {
      reference = *it;
      break;
    }
  }
  const double seconds = std::chrono::duration<double>(now - reference.first).count();
  if (seconds > 0.5) {
    window_rate_ = static_cast<double>(total_hashes_ - reference.second) / seconds;
  }
  smoothed_rate_ = smoothed_rate_ <= 0.0 ? window_rate_ : (smoothed_rate_ * 0.85 + window_rate_ * 0.15);
}

MiningStats StatsAggregator::snapshot_locked(std::chrono::steady_clock::time_point now) const {
  MiningStats out;
  out.total_hashes = total_hashes_;
  out.accepted = accepted_;
  out.rejected = rejected_;
  out.hashrate = window_rate_;
  out.smoothed_hashrate = smoothed_rate_;
  out.uptime_seconds = std::chrono::duration<double>(now - started_at_).count();
  out.average_hashrate = out.uptime_seconds > 0.0 ? static_cast<double>(total_hashes_) / out.uptime_seconds : 0.0;
  out.per_worker_hashes = per_worker_hashes_;
  out.hardware = hardware_;
  return out;
}

MiningStats StatsAggregator::snapshot() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return snapshot_locked(std::chrono::steady_clock::now());
}

MiningStats StatsAggregator::emit_summary() {
  const MiningStats stats = snapshot();
  const std::string line = format_summary(stats);
  if (options_.summary_sink) {
    options_.summary_sink(line);
  } else {
    log_info("stats", line);
  }
  return stats;
}

std::string format_summary(const MiningStats& stats) {
  std::ostringstream oss;
  oss << "Hashrate: " << format_hashrate(stats.hashrate)
      << " | Accepted/Rejected: " << stats.accepted << '/' << stats.rejected;
  oss << std::fixed << std::setprecision(1);
  const auto hw = stats.hardware.value_or(HardwareSnapshot{});
  oss << " | CPU: ";
  if (hw.cpu_pct) {
    oss << *hw.cpu_pct << '%';
  } else {
    oss << "n/a";
  }
  oss << " | Mem: " << (hw.mem_used_bytes ? format_bytes(*hw.mem_used_bytes) : std::string("n/a"));
  oss << " | Temp: ";
  if (hw.temperature_c) {
    oss << *hw.temperature_c << "°C";
  } else {
    oss << "n/a";
  }
  return oss.str();
}

} // namespace rxminer
