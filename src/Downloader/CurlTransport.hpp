#ifndef CURL_TRANSPORT_HPP_
#define CURL_TRANSPORT_HPP_

#include <string>

#include "DownloadConfig.hpp"
#include "Transport.hpp"

namespace parfetch {

struct TransportOptions {
  int timeoutSec = 30;
  bool verifyTls = true;
  std::string userAgent;
  ProxyConfig proxy;
  uint64_t uploadRateLimitBps = 0;
  size_t bufferSize = 1024 * 1024;
  long maxRedirects = 10;

  static TransportOptions fromConfig(const DownloadConfig& config);
};

// libcurl easy 接口实现；每次请求使用独立句柄，可被多个线程同时调用
class CurlTransport : public Transport {
 public:
  explicit CurlTransport(const TransportOptions& options);

  HeadResponse head(const std::string& url,
                    const CancellationToken* cancel) override;
  FetchResponse fetch(const FetchRequest& request,
                      const ChunkHandler& onChunk) override;

 private:
  TransportOptions options_;
};

}  // namespace parfetch

#endif  // CURL_TRANSPORT_HPP_
