#include "SegmentPlanner.hpp"

#include <algorithm>

namespace parfetch {

SegmentPlanner::SegmentPlanner(int maxWorkers, uint64_t smallFileThreshold)
    : maxWorkers_(std::max(1, maxWorkers)),
      smallFileThreshold_(smallFileThreshold) {}

int SegmentPlanner::workerCountFor(uint64_t totalSize,
                                   bool rangeSupport) const {
  if (!rangeSupport || totalSize <= smallFileThreshold_) return 1;
  return static_cast<int>(
      std::min<uint64_t>(static_cast<uint64_t>(maxWorkers_), totalSize));
}

std::vector<Segment> SegmentPlanner::plan(uint64_t totalSize,
                                          int workerCount) const {
  std::vector<Segment> segments;
  if (totalSize == 0) return segments;

  uint64_t count = static_cast<uint64_t>(std::clamp(workerCount, 1, maxWorkers_));
  count = std::min(count, totalSize);
  uint64_t chunk = totalSize / count;

  segments.reserve(count);
  for (uint64_t i = 0; i < count; ++i) {
    Segment segment;
    segment.index = static_cast<size_t>(i);
    segment.start = i * chunk;
    segment.end = (i == count - 1) ? (totalSize - 1) : (segment.start + chunk - 1);
    segments.push_back(segment);
  }
  return segments;
}

}  // namespace parfetch
