#include "rxminer/nonce_allocator.hpp"

#include <algorithm>
#include <stdexcept>

namespace rxminer {

NonceAllocator::NonceAllocator(uint32_t batch_size) : batch_size_(batch_size) {
  if (batch_size_ == 0) {
    throw std::invalid_argument("nonce batch size must be positive");
  }
}

void NonceAllocator::begin_job(uint64_t job_id, uint64_t start, uint64_t end) {
  auto epoch = std::make_shared<Epoch>();
  epoch->job_id = job_id;
  epoch->start = start;
  epoch->end = std::max(start, end);
  epoch->cursor.store(start, std::memory_order_relaxed);
  epoch_.store(std::move(epoch), std::memory_order_release);
}

std::optional<NonceRange> NonceAllocator::next_range(uint64_t job_id) {
  const auto epoch = epoch_.load(std::memory_order_acquire);
  if (!epoch || epoch->job_id != job_id) {
    return std::nullopt;
  }
  // Skip the fetch_add once exhausted so the cursor cannot creep toward wraparound.
  if (epoch->cursor.load(std::memory_order_relaxed) >= epoch->end) {
    return std::nullopt;
  }
  const uint64_t start = epoch->cursor.fetch_add(batch_size_, std::memory_order_relaxed);
  if (start >= epoch->end || start < epoch->start) {
    return std::nullopt;
  }
  NonceRange range;
  range.start = start;
  range.count = static_cast<uint32_t>(std::min<uint64_t>(batch_size_, epoch->end - start));
  return range;
}

uint64_t NonceAllocator::current_job_id() const {
  const auto epoch = epoch_.load(std::memory_order_acquire);
  return epoch ? epoch->job_id : 0;
}

uint64_t NonceAllocator::issued() const {
  const auto epoch = epoch_.load(std::memory_order_acquire);
  if (!epoch) {
    return 0;
  }
  return std::min(epoch->cursor.load(std::memory_order_relaxed), epoch->end) - epoch->start;
}

} // namespace rxminer
