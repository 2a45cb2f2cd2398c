#ifndef TRANSFER_SESSION_HPP_
#define TRANSFER_SESSION_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "DownloadError.hpp"
#include "RateLimiter.hpp"
#include "SegmentPlanner.hpp"
#include "SegmentSink.hpp"

namespace parfetch {

enum class SegmentState { PENDING = 0, IN_FLIGHT, COMPLETE, FAILED };

const char* segmentStateName(SegmentState state);

// 运行期的分片；IN_FLIGHT 期间只由所属 worker 修改
struct SegmentTask {
  SegmentTask(const Segment& seg, const std::string& sinkPath)
      : segment(seg), sink(sinkPath) {}

  void fail(ErrorKind kind, const std::string& message);

  Segment segment;
  std::atomic<SegmentState> state{SegmentState::PENDING};
  std::atomic<uint64_t> bytesTransferred{0};  // 包含续传前已在磁盘上的部分
  SegmentSink sink;
  ErrorKind errorKind = ErrorKind::NONE;
  std::string error;
};

// 分片文件的来历，写在 <destination>.parts；不匹配的分片文件不能续传
struct ResumeManifest {
  std::string url;
  uint64_t totalSize = 0;
  size_t segmentCount = 0;
  std::string validator;  // ETag，其次 Last-Modified，都没有时为空

  bool operator==(const ResumeManifest& other) const;
  bool operator!=(const ResumeManifest& other) const { return !(*this == other); }

  // 文件不存在或内容损坏时返回空
  static std::optional<ResumeManifest> load(const std::string& path);
  void save(const std::string& path) const;
};

/**
 * @brief 一次分片下载的全部状态
 *
 * 每个分片一个原子计数器，进度由各计数器求和得到，worker 之间没有共享
 * 的可变状态（限速器除外）。会话销毁时未被消费、也未保留的分片文件会被删除。
 */
class TransferSession {
 public:
  TransferSession(std::string url, std::string destination, uint64_t totalSize,
                  const std::vector<Segment>& plan, uint64_t rateLimitBps);

  ~TransferSession();

  TransferSession(const TransferSession&) = delete;
  TransferSession& operator=(const TransferSession&) = delete;

  const std::string& url() const { return url_; }
  uint64_t totalSize() const { return totalSize_; }

  std::vector<std::unique_ptr<SegmentTask>>& segments() { return segments_; }
  const std::vector<std::unique_ptr<SegmentTask>>& segments() const {
    return segments_;
  }
  RateLimiter& rateLimiter() { return rateLimiter_; }

  uint64_t bytesTransferred() const;
  size_t failureCount() const;
  bool allComplete() const;
  // 第一个失败分片，没有时返回 nullptr
  const SegmentTask* firstFailure() const;

  // 在 worker 启动前调用：磁盘上的分片文件来自同一 URL、同一大小、同一
  // 分片数且 validator 一致时返回 true；否则删除它们并写入新的记录
  bool adoptSinks(const std::string& validator);

  // 唯一的清理入口：keepSinks 为 true 时保留分片文件供下次续传
  void discard(bool keepSinks);

  static std::string sinkPathFor(const std::string& destination, size_t index);
  static std::string manifestPathFor(const std::string& destination);

 private:
  std::string url_;
  std::string destination_;
  uint64_t totalSize_;
  std::vector<std::unique_ptr<SegmentTask>> segments_;
  RateLimiter rateLimiter_;
  bool manifestWritten_ = false;
  bool manifestKept_ = false;
};

}  // namespace parfetch

#endif  // TRANSFER_SESSION_HPP_
