#include "SingleStreamDownload.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>

#include "DownloadError.hpp"
#include "RateLimiter.hpp"
#include "fs_utils.hpp"
#include "logger.hpp"

namespace parfetch {

SingleStreamDownload::SingleStreamDownload(Transport& transport,
                                           const DownloadConfig& config,
                                           const CancellationToken& cancel)
    : transport_(transport), config_(config), cancel_(cancel) {}

SingleStreamOutcome SingleStreamDownload::run(
    const std::string& url, const std::string& destination,
    const ProbeResult& probe, const ProgressCallback& progress) const {
  SingleStreamOutcome outcome;

  uint64_t existing = config_.resume ? utils::fileSizeOrZero(destination) : 0;
  if (existing > 0 && probe.sizeKnown && existing == probe.totalSize) {
    LOG(INFO) << "File already complete: " << destination;
    outcome.alreadyComplete = true;
    outcome.finalSize = existing;
    outcome.resumedFrom = existing;
    return outcome;
  }

  uint64_t resumeFrom = 0;
  if (existing > 0) {
    if (probe.rangeSupport && probe.sizeKnown && existing < probe.totalSize) {
      resumeFrom = existing;
      LOG(INFO) << "Resuming " << destination << " at byte " << resumeFrom;
    } else {
      LOG(WARN) << "Cannot resume " << destination << " (" << existing
                << " bytes on disk), restarting";
    }
  }
  outcome.resumedFrom = resumeFrom;

  std::ofstream out(destination, std::ios::binary |
                                     (resumeFrom > 0 ? std::ios::app
                                                     : std::ios::trunc));
  if (!out) {
    throw DownloadError(ErrorKind::DISK,
                        "Failed to open output file: " + destination);
  }

  std::atomic<uint64_t> done{resumeFrom};
  RateLimiter limiter(config_.rateLimitBps);
  ProgressAggregator aggregator(
      [&done]() { return done.load(std::memory_order_relaxed); },
      probe.sizeKnown ? probe.totalSize : 0, config_.progressInterval,
      progress);

  FetchRequest request;
  request.url = url;
  request.cancel = &cancel_;
  if (resumeFrom > 0) {
    request.rangeStart = resumeFrom;
    request.expectedStatus = 206;
  } else {
    request.expectedStatus = 200;
  }

  uint64_t received = 0;
  aggregator.start();
  try {
    transport_.fetch(request, [&](const char* data, size_t size) {
      if (cancel_.cancelled()) {
        throw DownloadError(ErrorKind::CANCELLED, "interrupted");
      }
      if (probe.sizeKnown && resumeFrom + received + size > probe.totalSize) {
        throw DownloadError(ErrorKind::PROTOCOL,
                            "server sent more bytes than advertised");
      }
      out.write(data, static_cast<std::streamsize>(size));
      if (!out) {
        throw DownloadError(ErrorKind::DISK, "Write failed on " + destination);
      }
      received += size;
      done.fetch_add(size, std::memory_order_relaxed);
      limiter.consume(size, &cancel_);
    });
    out.flush();
    if (!out) {
      throw DownloadError(ErrorKind::DISK, "Failed to flush " + destination);
    }
    uint64_t finalSize = resumeFrom + received;
    if (probe.sizeKnown && finalSize != probe.totalSize) {
      throw DownloadError(ErrorKind::PROTOCOL,
                          "incomplete body: got " + std::to_string(finalSize) +
                              " of " + std::to_string(probe.totalSize) +
                              " bytes");
    }
  } catch (const DownloadError& e) {
    aggregator.stop();
    out.close();
    // 只有下次能用范围请求接上时才保留前缀，否则重试会另起文件名
    bool resumable = probe.rangeSupport && probe.sizeKnown;
    bool keep = config_.resume && resumable &&
                (e.kind() != ErrorKind::CANCELLED || config_.keepPartialOnCancel);
    if (!keep) {
      std::error_code ec;
      std::filesystem::remove(destination, ec);
    }
    LOG(WARN) << "Single-stream download of " << url << " stopped after "
              << received << " bytes; partial file "
              << (keep ? "kept" : "removed");
    throw;
  }

  aggregator.stop();
  out.close();
  outcome.bytesReceived = received;
  outcome.finalSize = resumeFrom + received;
  LOG(INFO) << "Single-stream download finished: " << destination << " ("
            << outcome.finalSize << " bytes)";
  return outcome;
}

}  // namespace parfetch
