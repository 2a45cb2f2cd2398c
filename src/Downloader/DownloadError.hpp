#ifndef DOWNLOAD_ERROR_HPP_
#define DOWNLOAD_ERROR_HPP_

#include <stdexcept>
#include <string>

namespace parfetch {

enum class ErrorKind {
  NONE = 0,
  VALIDATION,           // URL 不合法或被策略拒绝，不重试
  NETWORK,              // 连接、超时、TLS
  PROTOCOL,             // 状态码或范围响应不符合预期
  DISK,                 // 空间不足、权限、写入失败
  INCOMPLETE_TRANSFER,  // 在分片未全部完成时请求合并
  INTEGRITY,            // 摘要与期望值不一致
  CANCELLED
};

const char* errorKindName(ErrorKind kind);

class DownloadError : public std::runtime_error {
 public:
  DownloadError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

}  // namespace parfetch

#endif  // DOWNLOAD_ERROR_HPP_
