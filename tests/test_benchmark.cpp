#include "rxminer/benchmark.hpp"

#include "support/stub_algorithm.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <numeric>
#include <thread>

namespace rxminer {
namespace {

using test::StubState;
using test::stub_factory;

BenchmarkOptions stub_options(std::chrono::milliseconds duration, uint32_t threads) {
  BenchmarkOptions options;
  options.algorithm = AlgorithmKind::RandomX;
  options.duration = duration;
  options.threads = threads;
  options.batch_size = 100;
  options.placement.pin = false;
  options.placement.numa_bind = false;
  options.placement.batch_priority = false;
  options.stats_interval = std::chrono::seconds(1);
  options.ready_timeout = std::chrono::seconds(10);
  return options;
}

TEST(BenchmarkTest, FourThreadsAtOneMillisecondPerHashReachAboutFortyThousand) {
  auto state = std::make_shared<StubState>();
  state->per_hash_cost = std::chrono::milliseconds(1);

  const auto report = run_benchmark(stub_options(std::chrono::seconds(10), 4), stub_factory(state));

  EXPECT_EQ(report.threads, 4U);
  EXPECT_EQ(report.algorithm, AlgorithmKind::RandomX);
  EXPECT_GE(report.total_hashes, 34000U);
  EXPECT_LE(report.total_hashes, 46000U);
  EXPECT_GE(report.average_hashrate, 3400.0);
  EXPECT_LE(report.average_hashrate, 4600.0);
  EXPECT_NEAR(report.elapsed_seconds, 10.0, 1.0);

  ASSERT_EQ(report.per_thread_hashes.size(), 4U);
  const uint64_t per_thread_sum =
    std::accumulate(report.per_thread_hashes.begin(), report.per_thread_hashes.end(), uint64_t{0});
  EXPECT_EQ(per_thread_sum, report.total_hashes);
  EXPECT_EQ(state->contexts_built.load(), 1U);
}

TEST(BenchmarkTest, ContextPreparationIsNotTimed) {
  auto state = std::make_shared<StubState>();
  state->per_hash_cost = std::chrono::milliseconds(1);
  state->build_delay = std::chrono::milliseconds(1500);

  const auto report = run_benchmark(stub_options(std::chrono::seconds(2), 1), stub_factory(state));

  EXPECT_LT(report.elapsed_seconds, 3.0);
  EXPECT_GT(report.average_hashrate, 700.0);
}

TEST(BenchmarkTest, InterruptEndsTheRunEarly) {
  auto state = std::make_shared<StubState>();
  state->per_hash_cost = std::chrono::microseconds(200);
  std::atomic<bool> interrupt{false};

  std::thread trigger([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    interrupt.store(true);
  });
  const auto started = std::chrono::steady_clock::now();
  const auto report = run_benchmark(stub_options(std::chrono::seconds(30), 2), stub_factory(state), &interrupt);
  const auto took = std::chrono::steady_clock::now() - started;
  trigger.join();

  EXPECT_LT(took, std::chrono::seconds(10));
  EXPECT_GT(report.total_hashes, 0U);
  EXPECT_LT(report.elapsed_seconds, 10.0);
}

TEST(BenchmarkTest, ContextFailureIsReported) {
  auto state = std::make_shared<StubState>();
  state->fail_build = true;

  EXPECT_THROW(run_benchmark(stub_options(std::chrono::seconds(1), 1), stub_factory(state)), ContextInitError);
}

TEST(BenchmarkTest, ReportFormat) {
  BenchmarkReport report;
  report.total_hashes = 40123;
  report.average_hashrate = 4012.3;
  EXPECT_EQ(
    format_benchmark_report(report),
    "Benchmark results:\nTotal hashes: 40123\nAverage hashrate: 4012.30 H/s\n");
}

} // namespace
} // namespace rxminer
