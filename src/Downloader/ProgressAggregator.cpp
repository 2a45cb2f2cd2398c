#include "ProgressAggregator.hpp"

#include <algorithm>

namespace parfetch {

ProgressAggregator::ProgressAggregator(Sampler sampler, uint64_t totalBytes,
                                       std::chrono::milliseconds interval,
                                       ProgressCallback callback)
    : sampler_(std::move(sampler)),
      totalBytes_(totalBytes),
      interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(100)),
      callback_(std::move(callback)),
      previousBytes_(0),
      initialBytes_(0),
      started_(false),
      stopped_(false),
      startedAt_(std::chrono::steady_clock::now()) {}

ProgressAggregator::~ProgressAggregator() { timer_.stop(); }

void ProgressAggregator::start() {
  {
    std::lock_guard<std::mutex> lock(sampleMutex_);
    if (started_) return;
    started_ = true;
    // 续传时已有的字节不计入速度
    previousBytes_ = initialBytes_ = sampler_();
    startedAt_ = std::chrono::steady_clock::now();
  }
  timer_.addPeriodicTask(interval_, interval_, [this]() {
    ProgressEvent event = sample();
    if (callback_) callback_(event);
  });
  timer_.start();
}

void ProgressAggregator::stop() {
  {
    std::lock_guard<std::mutex> lock(sampleMutex_);
    if (stopped_) return;
    stopped_ = true;
  }
  timer_.stop();

  uint64_t bytes = sampler_();
  double elapsed = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - startedAt_)
                       .count();
  double average = 0.0;
  if (elapsed > 0.0 && bytes > initialBytes_) {
    average = static_cast<double>(bytes - initialBytes_) / elapsed;
  }
  if (callback_) callback_(makeEvent(bytes, average, true));
}

ProgressEvent ProgressAggregator::sample() {
  std::lock_guard<std::mutex> lock(sampleMutex_);
  uint64_t bytes = sampler_();
  uint64_t delta = bytes >= previousBytes_ ? bytes - previousBytes_ : 0;
  previousBytes_ = bytes;
  double seconds = std::chrono::duration<double>(interval_).count();
  return makeEvent(bytes, static_cast<double>(delta) / seconds, false);
}

ProgressEvent ProgressAggregator::makeEvent(uint64_t bytes, double speed,
                                            bool final) const {
  ProgressEvent event;
  event.bytesDone = bytes;
  event.totalBytes = totalBytes_;
  event.speedBps = speed;
  event.final = final;
  if (totalBytes_ > 0) {
    event.percent = std::min(100.0, static_cast<double>(bytes) * 100.0 /
                                        static_cast<double>(totalBytes_));
    if (bytes >= totalBytes_) {
      event.etaSec = 0.0;
    } else if (speed > 0.0) {
      event.etaSec = static_cast<double>(totalBytes_ - bytes) / speed;
    }
  }
  return event;
}

}  // namespace parfetch
