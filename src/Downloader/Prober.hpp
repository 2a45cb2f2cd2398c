#ifndef PROBER_HPP_
#define PROBER_HPP_

#include <cstdint>
#include <string>

#include "CancellationToken.hpp"
#include "Transport.hpp"

namespace parfetch {

struct ProbeResult {
  uint64_t totalSize = 0;  // 未知或分块传输时为 0
  bool sizeKnown = false;
  std::string contentType = "unknown";
  std::string lastModified = "unknown";
  std::string etag;  // 服务端未给出时为空
  std::string server = "unknown";
  bool rangeSupport = false;
  std::string filename;
};

// 按优先级：Content-Disposition 中的文件名、URL 最后一段路径、时间戳
std::string deriveFilename(const std::string& url, const HeaderMap& headers);

// "1.5 MB"；size 为 0 时返回 "Unknown"
std::string formatSize(uint64_t size);

class Prober {
 public:
  explicit Prober(Transport& transport,
                  const CancellationToken* cancel = nullptr);

  // 代理、超时、TLS 与 User-Agent 由传入的 Transport 负责。
  // 失败时抛出 DownloadError(NETWORK / PROTOCOL)，本层不重试。
  ProbeResult probe(const std::string& url) const;

 private:
  Transport& transport_;
  const CancellationToken* cancel_;
};

}  // namespace parfetch

#endif  // PROBER_HPP_
