#pragma once

#include "rxminer/config.hpp"
#include "rxminer/job_source.hpp"
#include "rxminer/stratum_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace rxminer {

struct PoolSourceLimits {
  uint32_t max_connect_failures = 10;
  std::chrono::milliseconds reconnect_backoff{1000};
  std::chrono::milliseconds submit_timeout{10000};
};

// Pool mining over stratum. One I/O thread owns the connection; shares are
// handed to it and the caller waits for the pool's verdict.
class PoolJobSource final : public JobSource {
public:
  explicit PoolJobSource(PoolConfig config, PoolSourceLimits limits = {});
  ~PoolJobSource() override;

  std::string describe() const override;
  void start() override;
  void stop() override;
  std::optional<Job> next_job(std::chrono::milliseconds timeout) override;
  SubmitResult submit_share(const Share& share) override;

  static Job to_job(uint64_t id, StratumJob job);

private:
  struct PendingSubmit {
    std::string upstream_job_id;
    Share share;
    std::promise<SubmitResult> promise;
  };

  void io_loop();
  bool connect_and_login(std::string* error_message);
  void flush_outgoing();
  void handle_message(StratumMessage msg);
  void fail_inflight(const std::string& reason);
  void mark_unavailable(const std::string& reason);
  bool wait_backoff();

  PoolConfig config_;
  PoolSourceLimits limits_;
  Endpoint endpoint_;
  StratumClient client_;
  RecentJobs recent_;

  std::atomic<bool> stop_{false};
  std::thread io_thread_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  uint64_t next_job_id_ = 1;
  bool unavailable_ = false;
  std::string unavailable_reason_;
  std::deque<std::shared_ptr<PendingSubmit>> outgoing_;

  // I/O thread only.
  std::map<uint64_t, std::shared_ptr<PendingSubmit>> inflight_;
  std::chrono::steady_clock::time_point next_keepalive_;
};

} // namespace rxminer
