#include "timer.hpp"

namespace utils {

Timer::Timer() : running_(false) {}
Timer::~Timer() { stop(); }

void Timer::addPeriodicTask(std::chrono::milliseconds delay,
                            std::chrono::milliseconds period,
                            std::function<void()> callback) {
  if (period.count() <= 0) period = std::chrono::milliseconds(1);
  auto execution_time = std::chrono::steady_clock::now() + delay;
  std::lock_guard<std::mutex> lock(tasksMutex_);
  taskQueue_.emplace(execution_time, std::move(callback), period);
  tasksCv_.notify_one();
}

void Timer::start() {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  if (running_) return;
  running_ = true;
  timerThread_ = std::thread(&Timer::loop, this);
}

void Timer::loop() {
  std::unique_lock<std::mutex> lock(tasksMutex_);
  while (running_) {
    if (taskQueue_.empty()) {
      tasksCv_.wait(lock, [this]() { return !taskQueue_.empty() || !running_; });
      continue;
    }
    auto now = std::chrono::steady_clock::now();
    auto nextTask = taskQueue_.top();
    if (nextTask.execTimestamp > now) {
      tasksCv_.wait_until(lock, nextTask.execTimestamp, [this, &nextTask]() {
        return !running_ || taskQueue_.top().execTimestamp <
                                nextTask.execTimestamp;
      });
      continue;
    }

    taskQueue_.pop();
    nextTask.execTimestamp += nextTask.period;
    // 回调执行过慢时跳过错过的周期，不补发
    if (nextTask.execTimestamp < now) nextTask.execTimestamp = now + nextTask.period;
    taskQueue_.push(nextTask);

    lock.unlock();  // Unlock before executing the callback
    nextTask.callback();
    lock.lock();
  }
}

void Timer::stop() {
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    running_ = false;
    while (!taskQueue_.empty()) taskQueue_.pop();
    tasksCv_.notify_all();
  }

  if (timerThread_.joinable()) {
    timerThread_.join();
  }
}

bool Timer::running() const {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  return running_;
}

}  // namespace utils
