#ifndef DOWNLOAD_CONFIG_HPP_
#define DOWNLOAD_CONFIG_HPP_

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace parfetch {

struct ProxyConfig {
  std::string url;  // 例如 "socks5://host:1080"，为空表示不使用代理
  std::string username;
  std::string password;
};

/**
 * @brief 单次下载所需的全部配置
 *
 * 由上层（命令行）构造后以引用传入 Downloader；核心模块不读取 gflags。
 * 字段在 validate() 中统一校验，之后视为只读。
 */
struct DownloadConfig {
  static constexpr int kMaxWorkersCeiling = 32;

  std::string downloadDir = "downloads";
  int maxWorkers = 16;
  size_t chunkSize = 1024 * 1024;
  int timeoutSec = 30;
  int retries = 3;
  std::chrono::milliseconds retryBackoff{1000};
  bool verifyTls = true;
  std::string userAgent = "parfetch/1.0";
  ProxyConfig proxy;

  uint64_t rateLimitBps = 0;  // 整个下载共享，0 表示不限速
  uint64_t uploadRateLimitBps = 0;

  bool resume = true;
  bool keepPartialOnCancel = true;
  bool autoRename = true;
  bool checkDiskSpace = true;
  uint64_t minFreeSpaceMb = 100;
  uint64_t smallFileThreshold = 10 * 1024 * 1024;

  bool hashVerification = true;
  uint64_t hashMaxBytes = 100 * 1024 * 1024;

  std::vector<std::string> allowedSchemes{"http", "https", "ftp", "ftps",
                                          "sftp"};
  std::vector<std::string> blockedExtensions{".exe", ".scr", ".bat", ".cmd"};
  std::vector<std::string> blockedHosts{"localhost", "127.0.0.1", "0.0.0.0"};

  std::chrono::milliseconds progressInterval{100};

  // 不合法时抛出 DownloadError(VALIDATION)
  void validate() const;

  static DownloadConfig fromFlags();
};

// "a, b,,c" -> {"a", "b", "c"}
std::vector<std::string> splitList(const std::string& value, char delimiter = ',');

}  // namespace parfetch

#endif  // DOWNLOAD_CONFIG_HPP_
