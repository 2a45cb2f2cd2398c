#include <gflags/gflags.h>

#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "Downloader/CurlTransport.hpp"
#include "Downloader/Downloader.hpp"
#include "utils/logger.hpp"

DEFINE_string(output, "", "File name for a single download (default: derived)");
DEFINE_string(batch_file, "", "File with one URL per line");
DEFINE_string(expected_sha256, "", "Fail unless the file has this SHA-256");
DEFINE_string(log_dir, "logs", "Directory for parfetch.log");
DEFINE_string(log_level, "info", "debug, info, warn or error");
DEFINE_bool(quiet, false, "Do not draw the progress line");

namespace {

std::atomic<parfetch::CancellationToken*> g_cancel{nullptr};

void onSignal(int) {
  parfetch::CancellationToken* token = g_cancel.load();
  if (token) token->cancel();
}

// 在 Downloader 之后构造、之前析构，信号处理函数不会拿到悬空指针
class SignalBinding {
 public:
  explicit SignalBinding(parfetch::CancellationToken& token) {
    g_cancel.store(&token);
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
  }
  ~SignalBinding() { g_cancel.store(nullptr); }
};

std::string formatDuration(double seconds) {
  if (seconds < 0) return "--";
  long s = static_cast<long>(seconds + 0.5);
  std::ostringstream oss;
  if (s >= 3600) oss << s / 3600 << "h";
  if (s >= 60) oss << (s % 3600) / 60 << "m";
  oss << s % 60 << "s";
  return oss.str();
}

// 单行刷新的进度条
void printProgress(const parfetch::ProgressEvent& event) {
  constexpr int kBarLength = 40;
  constexpr double kMiB = 1024.0 * 1024.0;
  int filled = static_cast<int>(kBarLength * event.percent / 100.0);
  std::ostringstream line;
  line << "\r[" << std::string(filled, '#')
       << std::string(kBarLength - filled, '.') << "] " << std::fixed
       << std::setprecision(1) << event.percent << "% ("
       << event.bytesDone / kMiB << "MB";
  if (event.totalBytes > 0) line << "/" << event.totalBytes / kMiB << "MB";
  line << ") " << event.speedBps / kMiB << "MB/s ETA "
       << formatDuration(event.etaSec);
  std::cout << line.str() << std::flush;
  if (event.final) std::cout << std::endl;
}

void printResult(const parfetch::DownloadResult& result) {
  if (!result.success) {
    std::cout << "✗ " << result.url << ": "
              << parfetch::errorKindName(result.errorKind) << ": "
              << result.message << std::endl;
    return;
  }
  std::cout << "✓ " << result.destination << " ("
            << parfetch::formatSize(result.bytes) << ", " << std::fixed
            << std::setprecision(1) << result.elapsedSec << "s, "
            << result.averageSpeedBps / (1024.0 * 1024.0) << " MB/s)";
  if (result.sha256) std::cout << "\n  SHA256: " << *result.sha256;
  std::cout << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage("parfetch [flags] <url>... | --batch_file=<path>");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  std::vector<std::string> urls(argv + 1, argv + argc);
  if (urls.empty() && FLAGS_batch_file.empty()) {
    std::cerr << "Usage: " << argv[0]
              << " <url>... [--download_threads=N] [--batch_file=path]"
              << std::endl;
    return 2;
  }

  utils::LogConfig logCfg;
  logCfg.logFilePath = FLAGS_log_dir;
  logCfg.minLevel = utils::parseLogLevel(FLAGS_log_level);
  logCfg.logToConsole = FLAGS_quiet;  // 进度条和日志不混在一行
  utils::Logger::initialize(logCfg);

  try {
    if (!FLAGS_batch_file.empty()) {
      auto fromFile = parfetch::readUrlList(FLAGS_batch_file);
      urls.insert(urls.end(), fromFile.begin(), fromFile.end());
    }

    parfetch::DownloadConfig config = parfetch::DownloadConfig::fromFlags();
    auto transport = std::make_shared<parfetch::CurlTransport>(
        parfetch::TransportOptions::fromConfig(config));
    parfetch::Downloader downloader(config, transport);

    SignalBinding binding(downloader.cancellationToken());
    if (!FLAGS_quiet) downloader.setProgressCallback(printProgress);

    bool allOk = true;
    if (urls.size() == 1) {
      auto result = downloader.startDownload(urls[0], FLAGS_output,
                                             FLAGS_expected_sha256);
      printResult(result);
      allOk = result.success;
    } else {
      auto summary = downloader.startBatch(urls);
      for (const auto& result : summary.results) printResult(result);
      std::cout << "Batch: " << summary.succeeded << " succeeded, "
                << summary.failed << " failed, " << urls.size() << " total"
                << std::endl;
      allOk = summary.failed == 0 && summary.results.size() == urls.size();
    }
    return allOk ? 0 : 1;
  } catch (const parfetch::DownloadError& e) {
    LOG(FATAL) << e.what();
    std::cerr << parfetch::errorKindName(e.kind()) << ": " << e.what()
              << std::endl;
    return 2;
  }
}
