#pragma once

#include "rxminer/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

namespace rxminer {

// Hands out disjoint nonce ranges of the current job. Each job opens an epoch
// with its own cursor; next_range() is a single fetch_add on that cursor.
class NonceAllocator {
public:
  explicit NonceAllocator(uint32_t batch_size);

  void begin_job(uint64_t job_id, uint64_t start, uint64_t end);

  // Empty when job_id is no longer current or the job's interval is exhausted.
  std::optional<NonceRange> next_range(uint64_t job_id);

  uint64_t current_job_id() const;
  uint32_t batch_size() const { return batch_size_; }
  // Nonces handed out so far for the current job.
  uint64_t issued() const;

private:
  struct Epoch {
    uint64_t job_id = 0;
    uint64_t start = 0;
    uint64_t end = UINT64_MAX;
    std::atomic<uint64_t> cursor{0};
  };

  uint32_t batch_size_;
  std::atomic<std::shared_ptr<Epoch>> epoch_;
};

} // namespace rxminer
