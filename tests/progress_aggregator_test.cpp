#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "ProgressAggregator.hpp"

using namespace parfetch;

TEST(ProgressAggregatorTest, SampleComputesPercentSpeedAndEta) {
  uint64_t bytes = 0;
  ProgressAggregator aggregator([&bytes] { return bytes; }, 1000,
                                std::chrono::milliseconds(100), nullptr);
  bytes = 250;
  ProgressEvent event = aggregator.sample();
  EXPECT_EQ(event.bytesDone, 250u);
  EXPECT_EQ(event.totalBytes, 1000u);
  EXPECT_DOUBLE_EQ(event.percent, 25.0);
  // 250 字节 / 0.1 秒
  EXPECT_DOUBLE_EQ(event.speedBps, 2500.0);
  EXPECT_DOUBLE_EQ(event.etaSec, 0.3);
  EXPECT_FALSE(event.final);

  event = aggregator.sample();
  EXPECT_DOUBLE_EQ(event.speedBps, 0.0);
  EXPECT_DOUBLE_EQ(event.etaSec, -1.0);
}

TEST(ProgressAggregatorTest, UnknownTotalHasNoPercentOrEta) {
  uint64_t bytes = 500;
  ProgressAggregator aggregator([&bytes] { return bytes; }, 0,
                                std::chrono::milliseconds(100), nullptr);
  ProgressEvent event = aggregator.sample();
  EXPECT_DOUBLE_EQ(event.percent, 0.0);
  EXPECT_DOUBLE_EQ(event.etaSec, -1.0);
}

TEST(ProgressAggregatorTest, EmitsPeriodicEventsAndOneFinal) {
  std::atomic<uint64_t> bytes{0};
  std::mutex mutex;
  std::vector<ProgressEvent> events;
  ProgressAggregator aggregator(
      [&bytes] { return bytes.load(); }, 1000, std::chrono::milliseconds(10),
      [&](const ProgressEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
      });

  aggregator.start();
  for (int i = 0; i < 10; ++i) {
    bytes += 100;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  aggregator.stop();
  aggregator.stop();

  std::lock_guard<std::mutex> lock(mutex);
  ASSERT_GE(events.size(), 2u);
  size_t finals = 0;
  uint64_t last = 0;
  for (const auto& event : events) {
    EXPECT_GE(event.bytesDone, last);
    last = event.bytesDone;
    if (event.final) ++finals;
  }
  EXPECT_EQ(finals, 1u);
  EXPECT_TRUE(events.back().final);
  EXPECT_EQ(events.back().bytesDone, 1000u);
  EXPECT_DOUBLE_EQ(events.back().percent, 100.0);
  EXPECT_DOUBLE_EQ(events.back().etaSec, 0.0);
}

TEST(ProgressAggregatorTest, ConcurrentWritersAreCountedExactly) {
  std::vector<std::atomic<uint64_t>> counters(8);
  auto sampler = [&counters] {
    uint64_t sum = 0;
    for (auto& counter : counters) sum += counter.load(std::memory_order_relaxed);
    return sum;
  };
  ProgressAggregator aggregator(sampler, 8 * 10000,
                                std::chrono::milliseconds(5), nullptr);
  aggregator.start();

  std::vector<std::thread> workers;
  for (size_t t = 0; t < counters.size(); ++t) {
    workers.emplace_back([&counters, t] {
      for (int i = 0; i < 10000; ++i) {
        counters[t].fetch_add(1, std::memory_order_relaxed);
      }
    });
  }
  for (auto& worker : workers) worker.join();
  aggregator.stop();

  EXPECT_EQ(aggregator.sample().bytesDone, 80000u);
}
