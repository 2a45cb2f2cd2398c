#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

#include "CancellationToken.hpp"
#include "RateLimiter.hpp"

using namespace parfetch;
using Clock = std::chrono::steady_clock;

TEST(RateLimiterTest, UnlimitedNeverBlocks) {
  RateLimiter limiter(0);
  auto begin = Clock::now();
  for (int i = 0; i < 1000; ++i) limiter.consume(1 << 20);
  EXPECT_LT(Clock::now() - begin, std::chrono::milliseconds(200));
  EXPECT_EQ(limiter.limit(), 0u);
}

TEST(RateLimiterTest, SingleConsumerRespectsCap) {
  RateLimiter limiter(100000);
  auto begin = Clock::now();
  for (int i = 0; i < 10; ++i) limiter.consume(4000);
  double elapsed =
      std::chrono::duration<double>(Clock::now() - begin).count();
  // 40000 字节 / 100000 B/s
  EXPECT_GE(elapsed, 0.38);
}

TEST(RateLimiterTest, CapIsSharedAcrossThreads) {
  RateLimiter limiter(200000);
  auto begin = Clock::now();
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&limiter] {
      for (int i = 0; i < 10; ++i) limiter.consume(2500);
    });
  }
  for (auto& thread : threads) thread.join();
  double elapsed =
      std::chrono::duration<double>(Clock::now() - begin).count();
  // 总共 100000 字节，聚合上限 200000 B/s
  EXPECT_GE(elapsed, 0.48);
}

TEST(RateLimiterTest, CancellationCutsSleepShort) {
  RateLimiter limiter(1000);
  CancellationToken token;
  std::thread canceller([&token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    token.cancel();
  });
  auto begin = Clock::now();
  limiter.consume(10000, &token);  // 不取消需要 10 秒
  canceller.join();
  EXPECT_LT(Clock::now() - begin, std::chrono::seconds(2));
}
