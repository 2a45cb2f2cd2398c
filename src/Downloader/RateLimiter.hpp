#ifndef RATE_LIMITER_HPP_
#define RATE_LIMITER_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>

#include "CancellationToken.hpp"

namespace parfetch {

/**
 * @brief 一个下载内所有分片共享的限速器
 *
 * 每个块按 bytes / limit 占用一段时间槽，调用方睡眠到自己的槽结束；
 * 空闲期间不累积额度，所以持续传输的突发量不超过一个块。
 */
class RateLimiter {
 public:
  explicit RateLimiter(uint64_t bytesPerSecond);

  // 超出限速时阻塞当前线程；cancel 被触发时提前返回
  void consume(size_t bytes, const CancellationToken* cancel = nullptr);

  uint64_t limit() const { return bytesPerSecond_; }

 private:
  using Clock = std::chrono::steady_clock;

  uint64_t bytesPerSecond_;
  std::mutex mutex_;
  Clock::time_point nextSlot_;
};

}  // namespace parfetch

#endif  // RATE_LIMITER_HPP_
