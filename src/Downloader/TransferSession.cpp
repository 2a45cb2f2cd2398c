#include "TransferSession.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "logger.hpp"

namespace parfetch {

const char* segmentStateName(SegmentState state) {
  switch (state) {
    case SegmentState::PENDING:
      return "Pending";
    case SegmentState::IN_FLIGHT:
      return "InFlight";
    case SegmentState::COMPLETE:
      return "Complete";
    case SegmentState::FAILED:
      return "Failed";
    default:
      return "Unknown";
  }
}

void SegmentTask::fail(ErrorKind kind, const std::string& message) {
  errorKind = kind;
  error = message;
  state.store(SegmentState::FAILED, std::memory_order_release);
}

bool ResumeManifest::operator==(const ResumeManifest& other) const {
  return url == other.url && totalSize == other.totalSize &&
         segmentCount == other.segmentCount && validator == other.validator;
}

std::optional<ResumeManifest> ResumeManifest::load(const std::string& path) {
  std::ifstream in(path);
  if (!in) return std::nullopt;

  ResumeManifest manifest;
  bool hasUrl = false, hasSize = false, hasCount = false;
  std::string line;
  while (std::getline(in, line)) {
    auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    std::string key = line.substr(0, eq);
    std::string value = line.substr(eq + 1);
    try {
      if (key == "url") {
        manifest.url = value;
        hasUrl = true;
      } else if (key == "size") {
        manifest.totalSize = std::stoull(value);
        hasSize = true;
      } else if (key == "segments") {
        manifest.segmentCount = static_cast<size_t>(std::stoull(value));
        hasCount = true;
      } else if (key == "validator") {
        manifest.validator = value;
      }
    } catch (const std::exception& e) {
      LOG(WARN) << "Ignoring corrupt resume record " << path << ": " << e.what();
      return std::nullopt;
    }
  }
  if (!hasUrl || !hasSize || !hasCount) return std::nullopt;
  return manifest;
}

void ResumeManifest::save(const std::string& path) const {
  std::ofstream out(path, std::ios::trunc);
  out << "url=" << url << "\n"
      << "size=" << totalSize << "\n"
      << "segments=" << segmentCount << "\n"
      << "validator=" << validator << "\n";
  out.close();
  if (!out) {
    throw DownloadError(ErrorKind::DISK, "Failed to write resume record: " + path);
  }
}

TransferSession::TransferSession(std::string url, std::string destination,
                                 uint64_t totalSize,
                                 const std::vector<Segment>& plan,
                                 uint64_t rateLimitBps)
    : url_(std::move(url)),
      destination_(std::move(destination)),
      totalSize_(totalSize),
      rateLimiter_(rateLimitBps) {
  segments_.reserve(plan.size());
  for (const auto& segment : plan) {
    segments_.push_back(std::make_unique<SegmentTask>(
        segment, sinkPathFor(destination_, segment.index)));
  }
}

TransferSession::~TransferSession() {
  if (manifestWritten_ && !manifestKept_) {
    std::error_code ec;
    std::filesystem::remove(manifestPathFor(destination_), ec);
  }
}

bool TransferSession::adoptSinks(const std::string& validator) {
  ResumeManifest current;
  current.url = url_;
  current.totalSize = totalSize_;
  current.segmentCount = segments_.size();
  current.validator = validator;

  const std::string manifestPath = manifestPathFor(destination_);
  std::optional<ResumeManifest> previous = ResumeManifest::load(manifestPath);
  manifestWritten_ = true;
  if (previous && *previous == current) {
    LOG(INFO) << "Part files of " << destination_ << " match this download";
    return true;
  }

  // 旧计划的分片数可能更多，一并清掉
  size_t stale = std::max(segments_.size(),
                          previous ? previous->segmentCount : size_t{0});
  size_t removed = 0;
  for (size_t i = 0; i < stale; ++i) {
    std::error_code ec;
    if (std::filesystem::remove(sinkPathFor(destination_, i), ec)) ++removed;
  }
  if (removed > 0) {
    LOG(WARN) << "Discarded " << removed << " stale part files of "
              << destination_
              << (previous ? " (written for another plan or resource)"
                           : " (no resume record)");
  }
  current.save(manifestPath);
  return false;
}

uint64_t TransferSession::bytesTransferred() const {
  uint64_t total = 0;
  for (const auto& task : segments_) {
    total += task->bytesTransferred.load(std::memory_order_relaxed);
  }
  return total;
}

size_t TransferSession::failureCount() const {
  return static_cast<size_t>(std::count_if(
      segments_.begin(), segments_.end(), [](const auto& task) {
        return task->state.load(std::memory_order_acquire) ==
               SegmentState::FAILED;
      }));
}

bool TransferSession::allComplete() const {
  return std::all_of(segments_.begin(), segments_.end(), [](const auto& task) {
    return task->state.load(std::memory_order_acquire) == SegmentState::COMPLETE;
  });
}

const SegmentTask* TransferSession::firstFailure() const {
  for (const auto& task : segments_) {
    if (task->state.load(std::memory_order_acquire) == SegmentState::FAILED) {
      return task.get();
    }
  }
  return nullptr;
}

void TransferSession::discard(bool keepSinks) {
  manifestKept_ = keepSinks;
  for (auto& task : segments_) {
    if (keepSinks) {
      task->sink.keep();
    } else {
      task->sink.discard();
    }
  }
  LOG(INFO) << (keepSinks ? "Kept " : "Removed ") << segments_.size()
            << " part files for " << destination_;
}

std::string TransferSession::manifestPathFor(const std::string& destination) {
  return destination + ".parts";
}

std::string TransferSession::sinkPathFor(const std::string& destination,
                                         size_t index) {
  return destination + ".part" + std::to_string(index);
}

}  // namespace parfetch
