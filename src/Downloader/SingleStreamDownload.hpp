#ifndef SINGLE_STREAM_DOWNLOAD_HPP_
#define SINGLE_STREAM_DOWNLOAD_HPP_

#include <cstdint>
#include <string>

#include "CancellationToken.hpp"
#include "DownloadConfig.hpp"
#include "ProgressAggregator.hpp"
#include "Prober.hpp"
#include "Transport.hpp"

namespace parfetch {

struct SingleStreamOutcome {
  uint64_t bytesReceived = 0;  // 本次从网络收到的字节数
  uint64_t finalSize = 0;
  uint64_t resumedFrom = 0;
  bool alreadyComplete = false;
};

/**
 * @brief 不支持范围请求（或文件较小）时的顺序下载
 *
 * 与分片路径相同的进度、限速和取消约定，相当于只有一个覆盖全文件的分片。
 * 续传：目标文件已存在且开启续传时，从现有长度发起 "L-" 范围请求并追加；
 * 长度已等于总大小时直接返回，不访问网络。
 */
class SingleStreamDownload {
 public:
  SingleStreamDownload(Transport& transport, const DownloadConfig& config,
                       const CancellationToken& cancel);

  SingleStreamOutcome run(const std::string& url, const std::string& destination,
                          const ProbeResult& probe,
                          const ProgressCallback& progress) const;

 private:
  Transport& transport_;
  const DownloadConfig& config_;
  const CancellationToken& cancel_;
};

}  // namespace parfetch

#endif  // SINGLE_STREAM_DOWNLOAD_HPP_
