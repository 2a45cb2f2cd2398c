#include "DownloadConfig.hpp"

#include <gflags/gflags.h>

#include <algorithm>
#include <cctype>
#include <sstream>

#include "DownloadError.hpp"

DEFINE_string(download_dir, "downloads", "Directory downloads are saved to");
DEFINE_int32(download_threads, 16,
             "Maximum number of concurrent segments per download (1-32)");
DEFINE_uint64(chunk_size, 1024 * 1024, "Bytes written per chunk");
DEFINE_int32(timeout, 30, "Connect and stall timeout in seconds");
DEFINE_int32(retries, 3, "Whole-download retries after a network error");
DEFINE_int32(retry_backoff_ms, 1000, "Delay step between retries");
DEFINE_bool(verify_tls, true, "Verify TLS certificates");
DEFINE_string(user_agent, "parfetch/1.0", "User-Agent header");
DEFINE_string(proxy, "", "Proxy URL, e.g. http://host:8080 or socks5://host:1080");
DEFINE_string(proxy_user, "", "Proxy user name");
DEFINE_string(proxy_password, "", "Proxy password");
DEFINE_uint64(rate_limit, 0, "Download cap in bytes/sec, 0 for unlimited");
DEFINE_uint64(upload_rate_limit, 0, "Upload cap in bytes/sec, 0 for unlimited");
DEFINE_bool(resume, true, "Resume partially downloaded files");
DEFINE_bool(keep_partial_on_cancel, true,
            "Keep segment files on interrupt so the next run can resume");
DEFINE_bool(auto_rename, true, "Pick a new name when the destination exists");
DEFINE_bool(check_disk_space, true, "Check free space before downloading");
DEFINE_uint64(min_free_space_mb, 100, "Free space to keep beyond the file size");
DEFINE_uint64(small_file_threshold, 10 * 1024 * 1024,
              "Files up to this size are fetched with a single stream");
DEFINE_bool(hash_verification, true, "Compute SHA-256 of finished files");
DEFINE_uint64(hash_max_bytes, 100 * 1024 * 1024,
              "Skip hashing files larger than this");
DEFINE_string(allowed_schemes, "http,https,ftp,ftps,sftp", "Allowed URL schemes");
DEFINE_string(blocked_extensions, ".exe,.scr,.bat,.cmd",
              "File extensions that are refused");
DEFINE_string(blocked_hosts, "localhost,127.0.0.1,0.0.0.0",
              "Hosts that are refused");
DEFINE_int32(progress_interval_ms, 100, "Progress refresh interval");
DEFINE_string(custom_tbb_parallel_control, "",
              "TBB arena concurrency control, e.g. segments:8");

namespace parfetch {

std::vector<std::string> splitList(const std::string& value, char delimiter) {
  std::vector<std::string> items;
  std::istringstream ss(value);
  std::string item;
  while (std::getline(ss, item, delimiter)) {
    auto first = item.find_first_not_of(" \t");
    if (first == std::string::npos) continue;
    auto last = item.find_last_not_of(" \t");
    items.push_back(item.substr(first, last - first + 1));
  }
  return items;
}

void DownloadConfig::validate() const {
  auto fail = [](const std::string& message) {
    throw DownloadError(ErrorKind::VALIDATION, "invalid config: " + message);
  };
  if (downloadDir.empty()) fail("download directory is empty");
  if (maxWorkers < 1 || maxWorkers > kMaxWorkersCeiling) {
    fail("max workers must be in [1, " + std::to_string(kMaxWorkersCeiling) +
         "], got " + std::to_string(maxWorkers));
  }
  if (chunkSize == 0) fail("chunk size must be positive");
  if (timeoutSec <= 0) fail("timeout must be positive");
  if (retries < 0) fail("retries must not be negative");
  if (retryBackoff.count() < 0) fail("retry backoff must not be negative");
  if (progressInterval.count() <= 0) fail("progress interval must be positive");
  if (allowedSchemes.empty()) fail("no URL scheme is allowed");
  for (const auto& ext : blockedExtensions) {
    if (ext.empty() || ext[0] != '.') {
      fail("blocked extension '" + ext + "' must start with '.'");
    }
  }
}

DownloadConfig DownloadConfig::fromFlags() {
  DownloadConfig config;
  config.downloadDir = FLAGS_download_dir;
  config.maxWorkers = FLAGS_download_threads;
  config.chunkSize = static_cast<size_t>(FLAGS_chunk_size);
  config.timeoutSec = FLAGS_timeout;
  config.retries = FLAGS_retries;
  config.retryBackoff = std::chrono::milliseconds(FLAGS_retry_backoff_ms);
  config.verifyTls = FLAGS_verify_tls;
  config.userAgent = FLAGS_user_agent;
  config.proxy.url = FLAGS_proxy;
  config.proxy.username = FLAGS_proxy_user;
  config.proxy.password = FLAGS_proxy_password;
  config.rateLimitBps = FLAGS_rate_limit;
  config.uploadRateLimitBps = FLAGS_upload_rate_limit;
  config.resume = FLAGS_resume;
  config.keepPartialOnCancel = FLAGS_keep_partial_on_cancel;
  config.autoRename = FLAGS_auto_rename;
  config.checkDiskSpace = FLAGS_check_disk_space;
  config.minFreeSpaceMb = FLAGS_min_free_space_mb;
  config.smallFileThreshold = FLAGS_small_file_threshold;
  config.hashVerification = FLAGS_hash_verification;
  config.hashMaxBytes = FLAGS_hash_max_bytes;
  config.allowedSchemes = splitList(FLAGS_allowed_schemes);
  for (auto& scheme : config.allowedSchemes) {
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
  }
  config.blockedExtensions = splitList(FLAGS_blocked_extensions);
  config.blockedHosts = splitList(FLAGS_blocked_hosts);
  config.progressInterval = std::chrono::milliseconds(FLAGS_progress_interval_ms);
  config.validate();
  return config;
}

}  // namespace parfetch
