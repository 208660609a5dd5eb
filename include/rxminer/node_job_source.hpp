#pragma once

#include "rxminer/config.hpp"
#include "rxminer/job_source.hpp"
#include "rxminer/node_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace rxminer {

struct NodeSourceLimits {
  uint32_t max_consecutive_failures = 10;
  std::chrono::milliseconds retry_backoff{1000};
  std::chrono::milliseconds template_refresh{std::chrono::seconds(60)};
};

// Solo mining against a monerod node. A poll thread watches the chain height
// and fetches a fresh block template when it moves or the refresh period
// passes.
class NodeJobSource final : public JobSource {
public:
  explicit NodeJobSource(NodeConfig config, NodeSourceLimits limits = {});
  ~NodeJobSource() override;

  std::string describe() const override;
  void start() override;
  void stop() override;
  std::optional<Job> next_job(std::chrono::milliseconds timeout) override;
  SubmitResult submit_share(const Share& share) override;

  static Job to_job(uint64_t id, const BlockTemplate& tpl);
  // Template blob with the nonce written at its offset.
  static std::vector<uint8_t> block_with_nonce(const BlockTemplate& tpl, uint64_t nonce);

private:
  void poll_loop();
  void refresh_template();
  bool wait_for(std::chrono::milliseconds duration);
  void remember_template(uint64_t job_id, BlockTemplate tpl);

  NodeConfig config_;
  NodeSourceLimits limits_;
  Endpoint endpoint_;
  NodeClient client_;

  std::atomic<bool> stop_{false};
  std::thread poll_thread_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::optional<Job> latest_;
  uint64_t next_job_id_ = 1;
  bool unavailable_ = false;
  std::string unavailable_reason_;
  std::map<uint64_t, BlockTemplate> templates_;

  // Poll thread only.
  uint64_t known_height_ = 0;
  std::chrono::steady_clock::time_point last_refresh_;
};

} // namespace rxminer
