#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace rxminer {

struct ProgressDelta {
  uint32_t worker_index = 0;
  uint64_t hashes = 0;
};

enum class ShareOutcome {
  Accepted,
  Rejected,
};

struct ShareResult {
  uint64_t job_id = 0;
  ShareOutcome outcome = ShareOutcome::Rejected;
};

struct HardwareSnapshot {
  std::optional<double> cpu_pct;
  std::optional<uint64_t> mem_used_bytes;
  std::optional<double> temperature_c;
};

using StatsEvent = std::variant<ProgressDelta, ShareResult, HardwareSnapshot>;

// Unbounded many-producer single-consumer queue. send() never blocks beyond a
// short critical section.
class StatsChannel {
public:
  // Throws ChannelError once the channel is closed.
  void send(StatsEvent event);

  // Moves pending events into out. Waits until at least one event arrives,
  // the deadline passes or the channel closes. Returns false when the channel
  // is closed and fully drained.
  bool receive_until(std::chrono::steady_clock::time_point deadline, std::vector<StatsEvent>* out);

  void close();
  bool closed() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<StatsEvent> queue_;
  bool closed_ = false;
};

struct MiningStats {
  uint64_t total_hashes = 0;
  uint64_t accepted = 0;
  uint64_t rejected = 0;
  // Rate over the configured sliding window.
  double hashrate = 0.0;
  double smoothed_hashrate = 0.0;
  double average_hashrate = 0.0;
  double uptime_seconds = 0.0;
  std::vector<uint64_t> per_worker_hashes;
  std::optional<HardwareSnapshot> hardware;
};

struct StatsOptions {
  std::chrono::milliseconds report_interval{std::chrono::seconds(60)};
  std::chrono::milliseconds hashrate_window{std::chrono::seconds(60)};
  bool periodic_summaries = true;
  // Receives each summary line; logs at info level when empty.
  std::function<void(const std::string&)> summary_sink;
};

class StatsAggregator {
public:
  explicit StatsAggregator(StatsOptions options);
  ~StatsAggregator();

  StatsAggregator(const StatsAggregator&) = delete;
  StatsAggregator& operator=(const StatsAggregator&) = delete;

  StatsChannel& channel() { return channel_; }

  void start();
  // Closes the channel, applies everything already sent and joins the thread.
  void stop();

  MiningStats snapshot() const;
  // Emits one summary line through the sink and returns the stats it describes.
  MiningStats emit_summary();

private:
  void run();
  void apply(const StatsEvent& event);
  void sample_hashrate(std::chrono::steady_clock::time_point now);
  MiningStats snapshot_locked(std::chrono::steady_clock::time_point now) const;

  StatsOptions options_;
  StatsChannel channel_;
  std::thread thread_;

  mutable std::mutex state_mutex_;
  std::chrono::steady_clock::time_point started_at_;
  uint64_t total_hashes_ = 0;
  uint64_t accepted_ = 0;
  uint64_t rejected_ = 0;
  std::vector<uint64_t> per_worker_hashes_;
  std::optional<HardwareSnapshot> hardware_;
  std::deque<std::pair<std::chrono::steady_clock::time_point, uint64_t>> samples_;
  double window_rate_ = 0.0;
  double smoothed_rate_ = 0.0;
};

std::string format_summary(const MiningStats& stats);

} // namespace rxminer
