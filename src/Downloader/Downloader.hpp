#ifndef DOWNLOADER_HPP_
#define DOWNLOADER_HPP_

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "CancellationToken.hpp"
#include "DownloadConfig.hpp"
#include "DownloadError.hpp"
#include "ProgressAggregator.hpp"
#include "Prober.hpp"
#include "Transport.hpp"

namespace parfetch {

// 探测完成、目标路径确定后构造，进入规划阶段后不再修改
struct DownloadTarget {
  std::string url;
  std::string destination;
  std::string scheme;
  std::optional<uint64_t> size;  // 服务端未给出长度时为空
  bool rangeSupport = false;
  std::string filename;
  std::string validator;  // 判断旧分片文件是否来自同一资源
};

struct DownloadResult {
  bool success = false;
  ErrorKind errorKind = ErrorKind::NONE;
  std::string message;
  std::string url;
  std::string destination;
  uint64_t bytes = 0;  // 目标文件最终大小
  double elapsedSec = 0.0;
  double averageSpeedBps = 0.0;
  std::optional<std::string> sha256;
  int attempts = 0;
};

struct BatchSummary {
  size_t succeeded = 0;
  size_t failed = 0;
  std::vector<DownloadResult> results;
};

struct SessionStats {
  uint64_t totalDownloads = 0;
  uint64_t failedDownloads = 0;
  uint64_t totalBytes = 0;
  double averageSpeedBps = 0.0;
};

/**
 * @brief 下载编排：校验 -> 探测 -> 分片下载或单流下载 -> 合并 -> 摘要
 *
 * 只有 NETWORK 类错误会按 config.retries 整体重试；其余错误直接返回。
 * 统计信息属于实例，不存在进程级全局状态。
 */
class Downloader {
 public:
  Downloader(const DownloadConfig& config, std::shared_ptr<Transport> transport);
  ~Downloader();

  DownloadResult startDownload(const std::string& url,
                               const std::string& customFilename = "",
                               const std::string& expectedSha256 = "");
  // 顺序下载，单个失败不影响后续 URL
  BatchSummary startBatch(const std::vector<std::string>& urls);

  void cancelDownload() { cancel_.cancel(); }
  CancellationToken& cancellationToken() { return cancel_; }

  void setProgressCallback(ProgressCallback callback);
  SessionStats stats() const;
  const DownloadConfig& config() const { return config_; }

 private:
  struct Destination {
    std::string path;
    bool resumeExisting = false;
  };

  DownloadResult handleDownload(const std::string& url,
                                const std::string& customFilename,
                                const std::string& expectedSha256);
  Destination resolveDestination(const ProbeResult& probe,
                                 const std::string& customFilename) const;
  void checkDiskSpace(const ProbeResult& probe) const;
  uint64_t downloadSegmented(const DownloadTarget& target);
  void writeEmptyFile(const std::string& destination);
  void reportProgress(const ProgressEvent& event);
  void recordResult(const DownloadResult& result);
  bool waitBeforeRetry(int attempt);

  DownloadConfig config_;
  std::shared_ptr<Transport> transport_;
  CancellationToken cancel_;
  ProgressCallback progress_;

  mutable std::mutex statsMutex_;
  SessionStats stats_;
  double speedSum_;
};

// 一行一个 URL，跳过空行和以 '#' 开头的注释行
std::vector<std::string> readUrlList(const std::string& path);

}  // namespace parfetch

#endif  // DOWNLOADER_HPP_
