#ifndef CANCELLATION_TOKEN_HPP_
#define CANCELLATION_TOKEN_HPP_

#include <atomic>

namespace parfetch {

// 可在信号处理函数中调用 cancel()：只做一次无锁原子写
class CancellationToken {
 public:
  void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
  bool cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

 private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace parfetch

#endif  // CANCELLATION_TOKEN_HPP_
