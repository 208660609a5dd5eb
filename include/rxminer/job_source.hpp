#pragma once

#include "rxminer/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace rxminer {

enum class SubmitResult {
  Accepted,
  Rejected,
};

// Supplies jobs and accepts shares. next_job() and submit_share() may be
// called from different threads.
class JobSource {
public:
  virtual ~JobSource() = default;

  virtual std::string describe() const = 0;
  virtual void start() {}
  virtual void stop() {}

  // Blocks up to timeout. Throws ConnectionError when the source is permanently unavailable.
  virtual std::optional<Job> next_job(std::chrono::milliseconds timeout) = 0;

  // Throws SubmitError when the share could not be delivered.
  virtual SubmitResult submit_share(const Share& share) = 0;
};

// Jobs recently handed out by a source, so submissions can be mapped back to
// upstream identifiers.
class RecentJobs {
public:
  explicit RecentJobs(size_t capacity = 8) : capacity_(capacity) {}

  void remember(const Job& job);
  std::shared_ptr<const Job> find(uint64_t job_id) const;

private:
  size_t capacity_;
  mutable std::mutex mutex_;
  std::map<uint64_t, std::shared_ptr<const Job>> jobs_;
};

// Fixed all-zero work for throughput measurement. The zero target is never met.
class SyntheticJobSource final : public JobSource {
public:
  explicit SyntheticJobSource(AlgorithmKind kind);

  std::string describe() const override { return "synthetic benchmark job"; }
  std::optional<Job> next_job(std::chrono::milliseconds timeout) override;
  SubmitResult submit_share(const Share& share) override;

  static Job make_job(AlgorithmKind kind);

private:
  AlgorithmKind kind_;
  bool issued_ = false;
};

} // namespace rxminer
