#pragma once

#include "rxminer/hardware_platform.hpp"
#include "rxminer/stats.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace rxminer {

// CPU utilisation needs two readings; the first sample reports no CPU value.
class HardwareSampler {
public:
  HardwareSnapshot sample();

private:
  std::optional<CpuTimes> previous_;
};

// Posts a HardwareSnapshot to the stats channel every interval.
class HardwareMonitor {
public:
  HardwareMonitor(StatsChannel& channel, std::chrono::milliseconds interval);
  ~HardwareMonitor();

  HardwareMonitor(const HardwareMonitor&) = delete;
  HardwareMonitor& operator=(const HardwareMonitor&) = delete;

  void start();
  void stop();

private:
  void run();

  StatsChannel& channel_;
  std::chrono::milliseconds interval_;
  HardwareSampler sampler_;
  std::thread thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_ = false;
};

} // namespace rxminer
