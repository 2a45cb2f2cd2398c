#ifndef SEGMENT_PLANNER_HPP_
#define SEGMENT_PLANNER_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace parfetch {

// 闭区间 [start, end]；index 决定合并顺序
struct Segment {
  size_t index = 0;
  uint64_t start = 0;
  uint64_t end = 0;

  uint64_t length() const { return end - start + 1; }
};

class SegmentPlanner {
 public:
  SegmentPlanner(int maxWorkers, uint64_t smallFileThreshold);

  // 返回 1 表示应走单流下载
  int workerCountFor(uint64_t totalSize, bool rangeSupport) const;

  /**
   * @brief 把 [0, totalSize-1] 切成 workerCount 段
   *
   * 前面每段 floor(totalSize / workerCount) 字节，最后一段吸收余数。
   * workerCount 先被限制到 [1, maxWorkers]，再限制到 totalSize 以免出现空段；
   * totalSize 为 0 时返回空序列。
   */
  std::vector<Segment> plan(uint64_t totalSize, int workerCount) const;

 private:
  int maxWorkers_;
  uint64_t smallFileThreshold_;
};

}  // namespace parfetch

#endif  // SEGMENT_PLANNER_HPP_
