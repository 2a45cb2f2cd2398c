#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

#include "DownloadConfig.hpp"

// 每个测试独立的临时目录，析构时删除
class TempDir {
 public:
  TempDir() {
    static std::atomic<int> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("parfetch_test_" + std::to_string(stamp) + "_" +
             std::to_string(counter++));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::string file(const std::string& name) const { return (path_ / name).string(); }

 private:
  std::filesystem::path path_;
};

inline std::string makeBody(size_t size, unsigned seed = 7) {
  std::mt19937 rng(seed);
  std::string body(size, '\0');
  for (auto& c : body) c = static_cast<char>(rng() & 0xff);
  return body;
}

inline void writeFile(const std::string& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string readFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

inline bool anyPartFiles(const std::filesystem::path& dir) {
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (entry.path().string().find(".part") != std::string::npos) return true;
  }
  return false;
}

// 测试用配置：不重试等待、不检查磁盘、进度刷新更快
inline parfetch::DownloadConfig testConfig(const std::string& dir) {
  parfetch::DownloadConfig config;
  config.downloadDir = dir;
  config.maxWorkers = 4;
  config.chunkSize = 4096;
  config.retries = 0;
  config.retryBackoff = std::chrono::milliseconds(0);
  config.checkDiskSpace = false;
  config.smallFileThreshold = 1024;
  config.progressInterval = std::chrono::milliseconds(10);
  config.blockedHosts.clear();
  return config;
}
