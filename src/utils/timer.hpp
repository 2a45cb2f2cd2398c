#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace utils {

// 单线程定时器：所有回调在同一个后台线程上按时间顺序执行
class Timer {
 public:
  struct TimerTask {
    std::chrono::steady_clock::time_point execTimestamp;
    std::function<void()> callback;
    std::chrono::milliseconds period;

    TimerTask(std::chrono::steady_clock::time_point execTime,
              std::function<void()> cb, std::chrono::milliseconds periodDuration)
        : execTimestamp(execTime),
          callback(std::move(cb)),
          period(periodDuration) {}
    bool operator>(const TimerTask& other) const {
      return execTimestamp > other.execTimestamp;
    }
  };

  Timer();
  ~Timer();

  void addPeriodicTask(std::chrono::milliseconds delay,
                       std::chrono::milliseconds period,
                       std::function<void()> callback);
  void start();
  // 停止后台线程并丢弃未执行的任务；正在执行的回调会先完成
  void stop();
  bool running() const;

 private:
  void loop();

  std::priority_queue<TimerTask, std::vector<TimerTask>,
                      std::greater<TimerTask>>
      taskQueue_;
  mutable std::mutex tasksMutex_;
  std::condition_variable tasksCv_;
  std::thread timerThread_;
  bool running_;
};
}  // namespace utils
