#include "rxminer/job_source.hpp"

#include "rxminer/log.hpp"

#include <thread>

namespace rxminer {

namespace {

constexpr size_t kBenchmarkBlobSize = 76;
constexpr size_t kBenchmarkSeedSize = 32;

} // namespace

void RecentJobs::remember(const Job& job) {
  std::lock_guard<std::mutex> lock(mutex_);
  jobs_[job.id] = std::make_shared<const Job>(job);
  while (jobs_.size() > capacity_) {
    jobs_.erase(jobs_.begin());
  }
}

std::shared_ptr<const Job> RecentJobs::find(uint64_t job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = jobs_.find(job_id);
  return it == jobs_.end() ? nullptr : it->second;
}

SyntheticJobSource::SyntheticJobSource(AlgorithmKind kind) : kind_(kind) {}

Job SyntheticJobSource::make_job(AlgorithmKind kind) {
  Job job;
  job.id = 1;
  job.upstream_id = "benchmark";
  job.blob.bytes.assign(kBenchmarkBlobSize, 0);
  job.target = Target::zero();
  job.seed.assign(kBenchmarkSeedSize, 0);
  job.algorithm = kind;
  return job;
}

std::optional<Job> SyntheticJobSource::next_job(std::chrono::milliseconds timeout) {
  if (!issued_) {
    issued_ = true;
    return make_job(kind_);
  }
  std::this_thread::sleep_for(timeout);
  return std::nullopt;
}

SubmitResult SyntheticJobSource::submit_share(const Share& share) {
  log_debug("benchmark", "ignoring share for nonce " + std::to_string(share.nonce));
  return SubmitResult::Rejected;
}

} // namespace rxminer
