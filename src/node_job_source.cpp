#include "rxminer/node_job_source.hpp"

#include "rxminer/errors.hpp"
#include "rxminer/log.hpp"

#include <utility>

namespace rxminer {

namespace {

constexpr uint16_t kDefaultRpcPort = 18081;
constexpr size_t kRememberedTemplates = 8;
constexpr uint64_t kEmbeddedNonceSpace = 1ULL << 32;

} // namespace

NodeJobSource::NodeJobSource(NodeConfig config, NodeSourceLimits limits)
  : config_(std::move(config)),
    limits_(limits),
    endpoint_(parse_endpoint(config_.rpc_url, kDefaultRpcPort)),
    client_(endpoint_, config_.rpc_user, config_.rpc_password) {}

NodeJobSource::~NodeJobSource() {
  stop();
}

std::string NodeJobSource::describe() const {
  return "node " + format_endpoint(endpoint_);
}

Job NodeJobSource::to_job(uint64_t id, const BlockTemplate& tpl) {
  Job job;
  job.id = id;
  job.upstream_id = std::to_string(tpl.height) + ":" + tpl.prev_hash;
  job.blob.bytes = tpl.hashing_blob;
  job.blob.nonce_offset = tpl.nonce_offset;
  job.blob.height = tpl.height;
  job.target = Target::from_difficulty(tpl.difficulty);
  job.seed = tpl.seed;
  job.height = tpl.height;
  job.nonce_end = kEmbeddedNonceSpace;
  return job;
}

std::vector<uint8_t> NodeJobSource::block_with_nonce(const BlockTemplate& tpl, uint64_t nonce) {
  BlobTemplate blob;
  blob.bytes = tpl.template_blob;
  blob.nonce_offset = tpl.nonce_offset;
  std::vector<uint8_t> out;
  encode_hash_input(blob, nonce, &out);
  return out;
}

void NodeJobSource::start() {
  if (poll_thread_.joinable()) {
    return;
  }
  stop_.store(false);
  poll_thread_ = std::thread([this]() { poll_loop(); });
}

void NodeJobSource::stop() {
  stop_.store(true);
  client_.interrupt();
  cv_.notify_all();
  if (poll_thread_.joinable()) {
    poll_thread_.join();
  }
}

std::optional<Job> NodeJobSource::next_job(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this]() { return latest_.has_value() || unavailable_ || stop_.load(); });
  if (latest_) {
    std::optional<Job> out = std::move(latest_);
    latest_.reset();
    return out;
  }
  if (unavailable_) {
    throw ConnectionError("job source unavailable: " + unavailable_reason_);
  }
  return std::nullopt;
}

SubmitResult NodeJobSource::submit_share(const Share& share) {
  std::vector<uint8_t> block;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = templates_.find(share.job_id);
    if (it == templates_.end()) {
      throw SubmitError("block template for job " + std::to_string(share.job_id) + " is gone");
    }
    block = block_with_nonce(it->second, share.nonce);
  }

  try {
    std::string status;
    if (client_.submit_block(block, &status)) {
      log_info("node", "block accepted");
      return SubmitResult::Accepted;
    }
    log_warn("node", "block rejected: " + (status.empty() ? std::string("no status") : status));
    return SubmitResult::Rejected;
  } catch (const ProtocolError& e) {
    log_warn("node", std::string("block rejected: ") + e.what());
    return SubmitResult::Rejected;
  } catch (const ConnectionError& e) {
    throw SubmitError(e.what());
  }
}

void NodeJobSource::remember_template(uint64_t job_id, BlockTemplate tpl) {
  templates_[job_id] = std::move(tpl);
  while (templates_.size() > kRememberedTemplates) {
    templates_.erase(templates_.begin());
  }
}

void NodeJobSource::refresh_template() {
  BlockTemplate tpl = client_.get_block_template(config_.wallet_address);
  last_refresh_ = std::chrono::steady_clock::now();
  known_height_ = tpl.height;

  std::lock_guard<std::mutex> lock(mutex_);
  const uint64_t id = next_job_id_++;
  latest_ = to_job(id, tpl);
  log_debug(
    "node",
    "template height " + std::to_string(tpl.height) + " difficulty " + std::to_string(tpl.difficulty));
  remember_template(id, std::move(tpl));
  cv_.notify_all();
}

bool NodeJobSource::wait_for(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_for(lock, duration, [this]() { return stop_.load(); });
}

void NodeJobSource::poll_loop() {
  uint32_t failures = 0;
  bool outage_logged = false;
  bool have_template = false;

  while (!stop_.load()) {
    try {
      const auto now = std::chrono::steady_clock::now();
      if (!have_template || now - last_refresh_ >= limits_.template_refresh) {
        refresh_template();
        have_template = true;
      } else if (client_.height() != known_height_) {
        refresh_template();
      }
      if (outage_logged) {
        log_info("node", "connection to " + format_endpoint(endpoint_) + " restored");
      }
      failures = 0;
      outage_logged = false;
      if (!wait_for(std::chrono::milliseconds(config_.poll_interval_ms))) {
        break;
      }
    } catch (const MinerError& e) {
      if (stop_.load()) {
        break;
      }
      ++failures;
      if (!outage_logged) {
        log_warn("node", std::string(e.what()) + ", retrying");
        outage_logged = true;
      }
      if (failures >= limits_.max_consecutive_failures) {
        log_error("node", "giving up after " + std::to_string(failures) + " attempts, stopped");
        std::lock_guard<std::mutex> lock(mutex_);
        unavailable_ = true;
        unavailable_reason_ = e.what();
        cv_.notify_all();
        break;
      }
      if (!wait_for(limits_.retry_backoff)) {
        break;
      }
    }
  }
}

} // namespace rxminer
