#ifndef PROGRESS_AGGREGATOR_HPP_
#define PROGRESS_AGGREGATOR_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

#include "timer.hpp"

namespace parfetch {

struct ProgressEvent {
  uint64_t bytesDone = 0;
  uint64_t totalBytes = 0;  // 0 表示未知
  double percent = 0.0;
  double speedBps = 0.0;  // 最近一个采样周期内的瞬时速度
  double etaSec = -1.0;   // 无法估计时为 -1
  bool final = false;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

/**
 * @brief 按固定周期采样字节计数并产生进度事件
 *
 * 采样在定时器线程上进行，只读取原子计数器，不阻塞 worker。
 */
class ProgressAggregator {
 public:
  using Sampler = std::function<uint64_t()>;

  ProgressAggregator(Sampler sampler, uint64_t totalBytes,
                     std::chrono::milliseconds interval,
                     ProgressCallback callback);
  ~ProgressAggregator();

  void start();
  // 停止采样并发送一次 final 事件；可重复调用
  void stop();

  // 采样一次并更新上次采样值
  ProgressEvent sample();

 private:
  ProgressEvent makeEvent(uint64_t bytes, double speed, bool final) const;

  Sampler sampler_;
  uint64_t totalBytes_;
  std::chrono::milliseconds interval_;
  ProgressCallback callback_;
  utils::Timer timer_;
  std::mutex sampleMutex_;
  uint64_t previousBytes_;
  uint64_t initialBytes_;
  bool started_;
  bool stopped_;
  std::chrono::steady_clock::time_point startedAt_;
};

}  // namespace parfetch

#endif  // PROGRESS_AGGREGATOR_HPP_
