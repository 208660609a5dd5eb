#include "rxminer/nonce_allocator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace rxminer {
namespace {

TEST(NonceAllocatorTest, ConcurrentRangesAreDisjointAndComplete) {
  constexpr uint64_t kStart = 1000;
  constexpr uint64_t kEnd = 1000 + 250007;
  NonceAllocator allocator(97);
  allocator.begin_job(7, kStart, kEnd);

  std::mutex mutex;
  std::vector<NonceRange> ranges;
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      std::vector<NonceRange> local;
      while (auto range = allocator.next_range(7)) {
        local.push_back(*range);
      }
      std::lock_guard<std::mutex> lock(mutex);
      ranges.insert(ranges.end(), local.begin(), local.end());
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::sort(ranges.begin(), ranges.end(), [](const NonceRange& a, const NonceRange& b) { return a.start < b.start; });
  ASSERT_FALSE(ranges.empty());
  EXPECT_EQ(ranges.front().start, kStart);
  uint64_t expected = kStart;
  for (const auto& range : ranges) {
    ASSERT_EQ(range.start, expected);
    ASSERT_GT(range.count, 0U);
    expected += range.count;
  }
  EXPECT_EQ(expected, kEnd);
  EXPECT_EQ(allocator.issued(), kEnd - kStart);
}

TEST(NonceAllocatorTest, StaleJobIdGetsNothing) {
  NonceAllocator allocator(10);
  allocator.begin_job(1, 0, UINT64_MAX);
  ASSERT_TRUE(allocator.next_range(1).has_value());

  allocator.begin_job(2, 0, UINT64_MAX);
  EXPECT_FALSE(allocator.next_range(1).has_value());
  const auto range = allocator.next_range(2);
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(range->start, 0U);
  EXPECT_EQ(allocator.current_job_id(), 2U);
}

TEST(NonceAllocatorTest, LastRangeIsTruncatedThenExhausted) {
  NonceAllocator allocator(4);
  allocator.begin_job(3, 0, 10);
  EXPECT_EQ(allocator.next_range(3)->count, 4U);
  EXPECT_EQ(allocator.next_range(3)->count, 4U);
  const auto last = allocator.next_range(3);
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->start, 8U);
  EXPECT_EQ(last->count, 2U);
  EXPECT_FALSE(allocator.next_range(3).has_value());
  EXPECT_FALSE(allocator.next_range(3).has_value());
  EXPECT_EQ(allocator.issued(), 10U);
}

TEST(NonceAllocatorTest, NoJobMeansNoRanges) {
  NonceAllocator allocator(8);
  EXPECT_FALSE(allocator.next_range(0).has_value());
  EXPECT_EQ(allocator.current_job_id(), 0U);
  EXPECT_EQ(allocator.issued(), 0U);
}

TEST(NonceAllocatorTest, ZeroBatchSizeIsRejected) {
  EXPECT_THROW(NonceAllocator(0), std::invalid_argument);
}

} // namespace
} // namespace rxminer
