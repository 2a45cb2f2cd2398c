#ifndef TRANSPORT_HPP_
#define TRANSPORT_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

#include "CancellationToken.hpp"

namespace parfetch {

// 键为小写头名；重定向时只保留最后一个响应的头
using HeaderMap = std::map<std::string, std::string>;

struct HeadResponse {
  long status = 0;
  HeaderMap headers;
  bool hasContentLength = false;
  uint64_t contentLength = 0;
};

struct FetchRequest {
  std::string url;
  std::optional<uint64_t> rangeStart;
  std::optional<uint64_t> rangeEnd;  // 包含；只有 rangeStart 时为 "start-"
  long expectedStatus = 0;           // 非 0 时在写入第一个字节前校验
  const CancellationToken* cancel = nullptr;  // 连接和等待期间同样生效
};

struct FetchResponse {
  long status = 0;
  uint64_t bodyBytes = 0;
};

// 可抛出异常以中止传输，异常由 fetch() 原样重新抛出
using ChunkHandler = std::function<void(const char* data, size_t size)>;

/**
 * @brief 下载核心依赖的传输能力
 *
 * 实现需要处理代理、超时、TLS 校验和标识头等配置；出错时抛出
 * DownloadError(NETWORK / PROTOCOL)，取消时抛出 CANCELLED。非 HTTP 协议应把状态码规整为
 * 200（完整）或 206（范围）。
 */
class Transport {
 public:
  virtual ~Transport() = default;

  // 只取元数据，不传输响应体；cancel 可为空
  virtual HeadResponse head(const std::string& url,
                            const CancellationToken* cancel) = 0;

  virtual FetchResponse fetch(const FetchRequest& request,
                              const ChunkHandler& onChunk) = 0;
};

// "100-199" 或 "100-"，供 Range 头与 CURLOPT_RANGE 使用
std::string formatRange(const FetchRequest& request);

}  // namespace parfetch

#endif  // TRANSPORT_HPP_
