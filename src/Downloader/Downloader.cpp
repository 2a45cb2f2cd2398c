#include "Downloader.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

#include "IntegrityVerifier.hpp"
#include "Reassembler.hpp"
#include "SegmentPlanner.hpp"
#include "SegmentWorkerPool.hpp"
#include "SingleStreamDownload.hpp"
#include "TransferSession.hpp"
#include "UrlValidator.hpp"
#include "fs_utils.hpp"
#include "logger.hpp"

namespace parfetch {

namespace {

constexpr uint64_t kMiB = 1024 * 1024;

double secondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start)
      .count();
}

}  // namespace

Downloader::Downloader(const DownloadConfig& config,
                       std::shared_ptr<Transport> transport)
    : config_(config), transport_(std::move(transport)), speedSum_(0.0) {
  config_.validate();
  if (!transport_) {
    throw DownloadError(ErrorKind::VALIDATION, "no transport configured");
  }
}

Downloader::~Downloader() {}

void Downloader::setProgressCallback(ProgressCallback callback) {
  progress_ = std::move(callback);
}

SessionStats Downloader::stats() const {
  std::lock_guard<std::mutex> lock(statsMutex_);
  return stats_;
}

DownloadResult Downloader::startDownload(const std::string& url,
                                         const std::string& customFilename,
                                         const std::string& expectedSha256) {
  LOG(INFO) << "Starting download from " << url << " to "
            << config_.downloadDir << " with up to " << config_.maxWorkers
            << " segments.";

  auto started = std::chrono::steady_clock::now();
  const int maxAttempts = 1 + config_.retries;
  DownloadResult result;
  for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
    result = handleDownload(url, customFilename, expectedSha256);
    result.attempts = attempt;
    if (result.success || result.errorKind != ErrorKind::NETWORK ||
        attempt == maxAttempts) {
      break;
    }
    LOG(WARN) << "Attempt " << attempt << "/" << maxAttempts << " for " << url
              << " failed: " << result.message << ", retrying";
    if (!waitBeforeRetry(attempt)) {
      result.errorKind = ErrorKind::CANCELLED;
      result.message = "interrupted while waiting to retry";
      break;
    }
  }
  result.elapsedSec = secondsSince(started);

  if (result.success) {
    LOG(INFO) << "Download complete: " << result.destination << " ("
              << formatSize(result.bytes) << " in " << result.elapsedSec
              << "s)";
  } else {
    LOG(ERROR) << "Download failed: " << url << " ("
               << errorKindName(result.errorKind) << "): " << result.message;
  }
  recordResult(result);
  return result;
}

BatchSummary Downloader::startBatch(const std::vector<std::string>& urls) {
  BatchSummary summary;
  for (size_t i = 0; i < urls.size(); ++i) {
    if (cancel_.cancelled()) {
      LOG(WARN) << "Batch interrupted, " << urls.size() - i
                << " URLs not attempted";
      break;
    }
    LOG(INFO) << "[" << i + 1 << "/" << urls.size()
              << "] Processing: " << urls[i];
    DownloadResult result = startDownload(urls[i]);
    if (result.success) {
      ++summary.succeeded;
    } else {
      ++summary.failed;
    }
    summary.results.push_back(std::move(result));
  }
  LOG(INFO) << "Batch complete: " << summary.succeeded << " succeeded, "
            << summary.failed << " failed, " << urls.size() << " total";
  return summary;
}

DownloadResult Downloader::handleDownload(const std::string& url,
                                          const std::string& customFilename,
                                          const std::string& expectedSha256) {
  DownloadResult result;
  result.url = url;
  auto started = std::chrono::steady_clock::now();

  try {
    ValidationResult validation = validateUrl(url, UrlPolicy::fromConfig(config_));
    if (!validation.ok()) {
      throw DownloadError(ErrorKind::VALIDATION, validation.reason);
    }
    ParsedUrl parsed;
    if (!parseUrl(url, &parsed)) {
      throw DownloadError(ErrorKind::VALIDATION, "Malformed URL: '" + url + "'");
    }

    ProbeResult probe = Prober(*transport_, &cancel_).probe(url);

    std::error_code ec;
    std::filesystem::create_directories(config_.downloadDir, ec);
    if (ec) {
      throw DownloadError(ErrorKind::DISK, "Cannot create " +
                                               config_.downloadDir + ": " +
                                               ec.message());
    }
    checkDiskSpace(probe);

    Destination destination = resolveDestination(probe, customFilename);
    result.destination = destination.path;

    DownloadTarget target;
    target.url = url;
    target.destination = destination.path;
    target.scheme = parsed.scheme;
    if (probe.sizeKnown) target.size = probe.totalSize;
    target.rangeSupport = probe.rangeSupport;
    target.filename = probe.filename;
    if (!probe.etag.empty()) {
      target.validator = probe.etag;
    } else if (probe.lastModified != "unknown") {
      target.validator = probe.lastModified;
    }

    SegmentPlanner planner(config_.maxWorkers, config_.smallFileThreshold);
    uint64_t transferred = 0;
    if (target.size && *target.size == 0) {
      writeEmptyFile(target.destination);
    } else if (!destination.resumeExisting && target.size &&
               planner.workerCountFor(*target.size, target.rangeSupport) > 1) {
      transferred = downloadSegmented(target);
    } else {
      SingleStreamDownload fallback(*transport_, config_, cancel_);
      SingleStreamOutcome outcome = fallback.run(
          target.url, target.destination, probe,
          [this](const ProgressEvent& event) { reportProgress(event); });
      transferred = outcome.bytesReceived;
    }

    result.bytes = utils::fileSizeOrZero(destination.path);

    // 调用方给出期望值时无论大小都计算
    IntegrityVerifier verifier(config_.hashVerification || !expectedSha256.empty(),
                               expectedSha256.empty() ? config_.hashMaxBytes : 0);
    result.sha256 = verifier.digest(destination.path);
    if (result.sha256) {
      LOG(INFO) << "SHA256: " << *result.sha256;
    }
    if (!expectedSha256.empty() &&
        !IntegrityVerifier::matches(*result.sha256, expectedSha256)) {
      throw DownloadError(ErrorKind::INTEGRITY,
                          "SHA-256 mismatch: expected " + expectedSha256 +
                              ", got " + *result.sha256);
    }

    result.success = true;
    double elapsed = secondsSince(started);
    result.averageSpeedBps =
        elapsed > 0.0 ? static_cast<double>(transferred) / elapsed : 0.0;
  } catch (const DownloadError& e) {
    result.success = false;
    result.errorKind = e.kind();
    result.message = e.what();
  } catch (const std::filesystem::filesystem_error& e) {
    result.success = false;
    result.errorKind = ErrorKind::DISK;
    result.message = e.what();
  }
  return result;
}

Downloader::Destination Downloader::resolveDestination(
    const ProbeResult& probe, const std::string& customFilename) const {
  Destination destination;
  const std::string& name =
      customFilename.empty() ? probe.filename : customFilename;
  destination.path = utils::joinPath(config_.downloadDir, name);
  if (!utils::fileExists(destination.path)) return destination;

  uint64_t existing = utils::fileSizeOrZero(destination.path);
  if (config_.resume && probe.sizeKnown && existing > 0) {
    if (existing == probe.totalSize ||
        (existing < probe.totalSize && probe.rangeSupport)) {
      destination.resumeExisting = true;
      return destination;
    }
  }
  if (config_.autoRename) {
    std::string renamed = utils::uniquePath(destination.path);
    LOG(INFO) << destination.path << " exists, saving as " << renamed;
    destination.path = renamed;
  }
  return destination;
}

void Downloader::checkDiskSpace(const ProbeResult& probe) const {
  if (!config_.checkDiskSpace) return;
  uint64_t required = (probe.sizeKnown ? probe.totalSize : 0) +
                      config_.minFreeSpaceMb * kMiB;
  uint64_t available = utils::availableSpace(config_.downloadDir);
  if (available < required) {
    throw DownloadError(ErrorKind::DISK,
                        "Insufficient disk space: " +
                            std::to_string(available / kMiB) + "MB free, " +
                            std::to_string(required / kMiB) + "MB required");
  }
}

uint64_t Downloader::downloadSegmented(const DownloadTarget& target) {
  const uint64_t totalSize = *target.size;
  SegmentPlanner planner(config_.maxWorkers, config_.smallFileThreshold);
  int workers = planner.workerCountFor(totalSize, target.rangeSupport);
  TransferSession session(target.url, target.destination, totalSize,
                          planner.plan(totalSize, workers),
                          config_.rateLimitBps);
  LOG(INFO) << "Remote file size: " << session.totalSize() << ", "
            << session.segments().size() << " segments over "
            << target.scheme;
  bool resumable = session.adoptSinks(target.validator);

  ProgressAggregator aggregator(
      [&session]() { return session.bytesTransferred(); }, totalSize,
      config_.progressInterval,
      [this](const ProgressEvent& event) { reportProgress(event); });
  aggregator.start();
  SegmentWorkerPool pool(*transport_, cancel_, config_.resume && resumable);
  pool.run(session);
  aggregator.stop();

  if (cancel_.cancelled()) {
    session.discard(config_.keepPartialOnCancel);
    throw DownloadError(ErrorKind::CANCELLED, "download interrupted");
  }
  if (const SegmentTask* failed = session.firstFailure()) {
    LOG(ERROR) << session.failureCount() << " of " << session.segments().size()
               << " segments failed, discarding session";
    ErrorKind kind = failed->errorKind;
    std::string message = "segment " + std::to_string(failed->segment.index) +
                          " failed: " + failed->error;
    session.discard(false);
    throw DownloadError(kind, message);
  }

  Reassembler reassembler(config_.chunkSize);
  return reassembler.reassemble(session, target.destination);
}

void Downloader::writeEmptyFile(const std::string& destination) {
  std::ofstream out(destination, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw DownloadError(ErrorKind::DISK,
                        "Failed to create output file: " + destination);
  }
  out.close();
  ProgressEvent event;
  event.percent = 100.0;
  event.etaSec = 0.0;
  event.final = true;
  reportProgress(event);
  LOG(INFO) << "Remote file is empty, created " << destination;
}

void Downloader::reportProgress(const ProgressEvent& event) {
  if (progress_) progress_(event);
}

void Downloader::recordResult(const DownloadResult& result) {
  std::lock_guard<std::mutex> lock(statsMutex_);
  if (!result.success) {
    ++stats_.failedDownloads;
    return;
  }
  ++stats_.totalDownloads;
  stats_.totalBytes += result.bytes;
  speedSum_ += result.averageSpeedBps;
  stats_.averageSpeedBps = speedSum_ / static_cast<double>(stats_.totalDownloads);
}

bool Downloader::waitBeforeRetry(int attempt) {
  auto deadline = std::chrono::steady_clock::now() + config_.retryBackoff * attempt;
  while (std::chrono::steady_clock::now() < deadline) {
    if (cancel_.cancelled()) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return !cancel_.cancelled();
}

std::vector<std::string> readUrlList(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw DownloadError(ErrorKind::DISK, "Failed to read URL list: " + path);
  }
  std::vector<std::string> urls;
  std::string line;
  while (std::getline(in, line)) {
    auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') continue;
    auto last = line.find_last_not_of(" \t\r");
    urls.push_back(line.substr(first, last - first + 1));
  }
  return urls;
}

}  // namespace parfetch
