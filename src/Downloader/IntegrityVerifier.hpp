#ifndef INTEGRITY_VERIFIER_HPP_
#define INTEGRITY_VERIFIER_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace parfetch {

class IntegrityVerifier {
 public:
  IntegrityVerifier(bool enabled, uint64_t maxBytes);

  // 关闭或文件超过阈值时返回 std::nullopt；读取失败抛出 DownloadError(DISK)
  std::optional<std::string> digest(const std::string& path) const;

  // 流式计算文件的 SHA-256，返回小写十六进制
  static std::string sha256File(const std::string& path);

  // 忽略大小写与首尾空白
  static bool matches(const std::string& digest, const std::string& expected);

 private:
  bool enabled_;
  uint64_t maxBytes_;
};

}  // namespace parfetch

#endif  // INTEGRITY_VERIFIER_HPP_
