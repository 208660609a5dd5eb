#include "rxminer/hardware.hpp"

#include "rxminer/errors.hpp"
#include "rxminer/log.hpp"

#include <algorithm>

namespace rxminer {

HardwareSnapshot HardwareSampler::sample() {
  HardwareSnapshot out;
  CpuTimes now;
  if (os_read_cpu_times(&now)) {
    if (previous_ && now.total > previous_->total) {
      const double busy = static_cast<double>(now.busy - std::min(now.busy, previous_->busy));
      const double total = static_cast<double>(now.total - previous_->total);
      out.cpu_pct = std::clamp(busy * 100.0 / total, 0.0, 100.0);
    }
    previous_ = now;
  }
  out.mem_used_bytes = os_memory_used_bytes();
  out.temperature_c = os_cpu_temperature_c();
  return out;
}

HardwareMonitor::HardwareMonitor(StatsChannel& channel, std::chrono::milliseconds interval)
  : channel_(channel),
    interval_(interval) {}

HardwareMonitor::~HardwareMonitor() {
  stop();
}

void HardwareMonitor::start() {
  if (thread_.joinable()) {
    return;
  }
  // Prime the CPU counters so the first report carries a utilisation value.
  (void)sampler_.sample();
  thread_ = std::thread([this]() { run(); });
}

void HardwareMonitor::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void HardwareMonitor::run() {
  // Report slightly ahead of the stats summary so each summary sees a fresh snapshot.
  const auto lead = std::min<std::chrono::milliseconds>(interval_ / 10, std::chrono::seconds(1));
  auto next = std::chrono::steady_clock::now() + interval_ - lead;
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (cv_.wait_until(lock, next, [this]() { return stop_; })) {
        return;
      }
    }
    next += interval_;
    try {
      channel_.send(sampler_.sample());
    } catch (const ChannelError&) {
      log_debug("hardware", "stats channel closed, monitor stopping");
      return;
    }
  }
}

} // namespace rxminer
