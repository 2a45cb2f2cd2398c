#ifndef SEGMENT_WORKER_POOL_HPP_
#define SEGMENT_WORKER_POOL_HPP_

#include "CancellationToken.hpp"
#include "TransferSession.hpp"
#include "Transport.hpp"

namespace parfetch {

/**
 * @brief 每个分片一个并发任务
 *
 * 任务向 [start, end] 发起范围请求，按块写入分片文件，每块之后累加计数、
 * 执行限速，结束时把分片标记为 COMPLETE 或 FAILED。一个分片失败不会
 * 取消其他分片。
 */
class SegmentWorkerPool {
 public:
  static constexpr const char* kArenaName = "segments";

  SegmentWorkerPool(Transport& transport, const CancellationToken& cancel,
                    bool resume);

  // 阻塞直到所有分片进入终态
  void run(TransferSession& session);

 private:
  void runSegment(TransferSession& session, SegmentTask& task);
  void fetchSegment(TransferSession& session, SegmentTask& task);

  Transport& transport_;
  const CancellationToken& cancel_;
  bool resume_;
};

}  // namespace parfetch

#endif  // SEGMENT_WORKER_POOL_HPP_
