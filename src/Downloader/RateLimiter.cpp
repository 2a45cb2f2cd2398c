#include "RateLimiter.hpp"

#include <algorithm>
#include <thread>

namespace parfetch {

namespace {
constexpr std::chrono::milliseconds kSleepSlice(50);
}  // namespace

RateLimiter::RateLimiter(uint64_t bytesPerSecond)
    : bytesPerSecond_(bytesPerSecond), nextSlot_() {}

void RateLimiter::consume(size_t bytes, const CancellationToken* cancel) {
  if (bytesPerSecond_ == 0 || bytes == 0) return;

  auto cost = std::chrono::duration_cast<Clock::duration>(
      std::chrono::duration<double>(static_cast<double>(bytes) /
                                    static_cast<double>(bytesPerSecond_)));
  Clock::time_point wake;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    if (nextSlot_ < now) nextSlot_ = now;
    nextSlot_ += cost;
    wake = nextSlot_;
  }

  // 分段睡眠，便于及时响应取消
  for (auto now = Clock::now(); now < wake; now = Clock::now()) {
    if (cancel && cancel->cancelled()) return;
    std::this_thread::sleep_for(std::min<Clock::duration>(wake - now, kSleepSlice));
  }
}

}  // namespace parfetch
