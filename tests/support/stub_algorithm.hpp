#pragma once

#include "rxminer/algorithm.hpp"
#include "rxminer/errors.hpp"
#include "rxminer/job_source.hpp"
#include "rxminer/scheduler.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace rxminer::test {

// Shared knobs and counters for every stub context and engine.
struct StubState {
  // Nonces for which the stub hash returns an all-zero digest; every other
  // nonce hashes to all 0xFF, which meets no target.
  std::function<bool(const BlobTemplate&, uint64_t)> is_solution;
  // Fixed cost per hash; zero hashes as fast as possible.
  std::chrono::microseconds per_hash_cost{0};
  std::chrono::milliseconds build_delay{0};
  bool fail_build = false;

  std::atomic<uint64_t> contexts_built{0};
  std::atomic<uint64_t> engines_created{0};
  std::atomic<uint64_t> hashes{0};
  std::atomic<int> faults_to_inject{0};
};

class StubEngine final : public HashEngine {
public:
  explicit StubEngine(std::shared_ptr<StubState> state) : state_(std::move(state)) {}

  Digest hash(const BlobTemplate& blob, uint64_t nonce) override {
    int pending = state_->faults_to_inject.load();
    while (pending > 0) {
      if (state_->faults_to_inject.compare_exchange_weak(pending, pending - 1)) {
        throw std::runtime_error("injected engine fault");
      }
    }

    pace();
    state_->hashes.fetch_add(1, std::memory_order_relaxed);

    Digest digest;
    const bool solved = state_->is_solution && state_->is_solution(blob, nonce);
    digest.bytes.fill(solved ? 0x00 : 0xFF);
    return digest;
  }

private:
  // Keeps a fixed schedule so the long-run rate is exact; a long idle gap
  // resets it instead of bursting.
  void pace() {
    if (state_->per_hash_cost.count() == 0) {
      return;
    }
    const auto now = std::chrono::steady_clock::now();
    if (next_slot_ == std::chrono::steady_clock::time_point{} || now - next_slot_ > std::chrono::milliseconds(50)) {
      next_slot_ = now;
    }
    next_slot_ += state_->per_hash_cost;
    std::this_thread::sleep_until(next_slot_);
  }

  std::shared_ptr<StubState> state_;
  std::chrono::steady_clock::time_point next_slot_{};
};

class StubContext final : public AlgorithmContext {
public:
  StubContext(AlgorithmKind kind, std::vector<uint8_t> seed, MemoryMode mode, std::shared_ptr<StubState> state)
    : AlgorithmContext(kind, std::move(seed), mode), state_(std::move(state)) {}

  std::unique_ptr<HashEngine> new_engine() const override {
    state_->engines_created.fetch_add(1, std::memory_order_relaxed);
    return std::make_unique<StubEngine>(state_);
  }

private:
  std::shared_ptr<StubState> state_;
};

class StubAlgorithm final : public Algorithm {
public:
  StubAlgorithm(AlgorithmKind kind, std::shared_ptr<StubState> state) : kind_(kind), state_(std::move(state)) {}

  AlgorithmKind kind() const override { return kind_; }

  std::shared_ptr<const AlgorithmContext> build_context(const std::vector<uint8_t>& seed, MemoryMode mode) const override {
    if (state_->build_delay.count() > 0) {
      std::this_thread::sleep_for(state_->build_delay);
    }
    if (state_->fail_build) {
      throw ContextInitError("stub context refused to build");
    }
    state_->contexts_built.fetch_add(1, std::memory_order_relaxed);
    return std::make_shared<StubContext>(kind_, seed, mode, state_);
  }

private:
  AlgorithmKind kind_;
  std::shared_ptr<StubState> state_;
};

inline AlgorithmFactory stub_factory(std::shared_ptr<StubState> state) {
  return [state](AlgorithmKind kind) { return std::make_unique<StubAlgorithm>(kind, state); };
}

// Accepts every share and records it together with the highest job id the
// test had finished installing when the share arrived.
class RecordingJobSource final : public JobSource {
public:
  struct Record {
    Share share;
    uint64_t installed_before = 0;
  };

  std::string describe() const override { return "recording source"; }

  std::optional<Job> next_job(std::chrono::milliseconds timeout) override {
    std::this_thread::sleep_for(timeout);
    return std::nullopt;
  }

  SubmitResult submit_share(const Share& share) override {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(Record{share, installed.load()});
    return SubmitResult::Accepted;
  }

  std::vector<Record> records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
  }

  size_t count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
  }

  std::atomic<uint64_t> installed{0};

private:
  mutable std::mutex mutex_;
  std::vector<Record> records_;
};

inline Job make_test_job(uint64_t id, uint8_t marker, uint64_t nonce_end = UINT64_MAX) {
  Job job;
  job.id = id;
  job.upstream_id = "job-" + std::to_string(id);
  job.blob.bytes.assign(43, 0);
  job.blob.bytes[0] = marker;
  job.target = Target::max();
  job.seed.assign(32, 0x11);
  job.nonce_end = nonce_end;
  return job;
}

// Polls pred every millisecond until it holds or timeout passes.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

} // namespace rxminer::test
