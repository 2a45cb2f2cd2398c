#ifndef URL_VALIDATOR_HPP_
#define URL_VALIDATOR_HPP_

#include <string>
#include <vector>

#include "DownloadConfig.hpp"

namespace parfetch {

struct UrlPolicy {
  std::vector<std::string> allowedSchemes;
  std::vector<std::string> blockedExtensions;
  std::vector<std::string> blockedHosts;

  static UrlPolicy fromConfig(const DownloadConfig& config);
};

enum class ValidationStatus {
  OK = 0,
  MALFORMED,
  DISALLOWED_SCHEME,
  MISSING_HOST,
  BLOCKED_HOST,
  BLOCKED_EXTENSION
};

struct ValidationResult {
  ValidationStatus status = ValidationStatus::OK;
  std::string reason;

  bool ok() const { return status == ValidationStatus::OK; }
};

struct ParsedUrl {
  std::string scheme;  // 小写
  std::string host;    // 小写，不含端口、用户信息和 IPv6 方括号
  std::string port;
  std::string path;    // 未解码，不含查询串和片段
};

// 只做语法解析（libcurl URL API），不做网络 I/O；无法解析时返回 false
bool parseUrl(const std::string& url, ParsedUrl* out);

// 百分号解码；无法解码的 % 序列原样保留
std::string urlDecode(const std::string& value);

// 纯函数，不做任何 I/O
ValidationResult validateUrl(const std::string& url, const UrlPolicy& policy);

}  // namespace parfetch

#endif  // URL_VALIDATOR_HPP_
