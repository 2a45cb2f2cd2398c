#include "SegmentWorkerPool.hpp"

#include <filesystem>

#include "logger.hpp"
#include "tbb_manager.hpp"

namespace parfetch {

SegmentWorkerPool::SegmentWorkerPool(Transport& transport,
                                     const CancellationToken& cancel,
                                     bool resume)
    : transport_(transport), cancel_(cancel), resume_(resume) {}

void SegmentWorkerPool::run(TransferSession& session) {
  auto& segments = session.segments();
  if (segments.empty()) return;

  int workers = static_cast<int>(segments.size());
  LOG(INFO) << "Starting " << workers << " segment workers for "
            << session.url();

  // 多线程分片下载，一个分片一个任务
  utils::TBBManager::GetInstance().ParallelFor<size_t>(
      kArenaName, 0, segments.size(),
      [this, &session, &segments](size_t idx) {
        runSegment(session, *segments[idx]);
      },
      workers);

  for (auto& task : segments) {
    SegmentState state = task->state.load(std::memory_order_acquire);
    if (state != SegmentState::COMPLETE && state != SegmentState::FAILED) {
      task->fail(ErrorKind::INCOMPLETE_TRANSFER,
                 "worker exited while segment was " +
                     std::string(segmentStateName(state)));
    }
  }
}

void SegmentWorkerPool::runSegment(TransferSession& session,
                                   SegmentTask& task) {
  const Segment& seg = task.segment;
  if (cancel_.cancelled()) {
    task.fail(ErrorKind::CANCELLED, "cancelled before start");
    return;
  }
  task.state.store(SegmentState::IN_FLIGHT, std::memory_order_release);

  try {
    fetchSegment(session, task);
    task.state.store(SegmentState::COMPLETE, std::memory_order_release);
    LOG(INFO) << "Segment " << seg.index << " done.";
    return;
  } catch (const DownloadError& e) {
    task.fail(e.kind(), e.what());
  } catch (const std::filesystem::filesystem_error& e) {
    task.fail(ErrorKind::DISK, e.what());
  }

  if (task.errorKind == ErrorKind::CANCELLED) {
    LOG(WARN) << "Segment " << seg.index << " stopped: " << task.error;
  } else {
    LOG(ERROR) << "Segment " << seg.index << " failed ("
               << errorKindName(task.errorKind) << "): " << task.error;
  }
}

void SegmentWorkerPool::fetchSegment(TransferSession& session,
                                     SegmentTask& task) {
  const Segment& seg = task.segment;
  const uint64_t length = seg.length();

  uint64_t offset = 0;
  if (resume_) {
    uint64_t existing = task.sink.existingSize();
    if (existing == length) {
      task.bytesTransferred.store(length, std::memory_order_relaxed);
      LOG(INFO) << "Segment " << seg.index << " already on disk, skipping.";
      return;
    }
    if (existing < length) offset = existing;
  }

  task.sink.open(offset > 0);
  task.bytesTransferred.store(offset, std::memory_order_relaxed);

  FetchRequest request;
  request.url = session.url();
  request.rangeStart = seg.start + offset;
  request.rangeEnd = seg.end;
  request.expectedStatus = 206;
  request.cancel = &cancel_;

  LOG(INFO) << "Downloading segment " << seg.index << " [" << seg.start << "-"
            << seg.end << "]"
            << (offset > 0 ? " resuming at +" + std::to_string(offset) : "");

  uint64_t received = offset;
  transport_.fetch(request, [&](const char* data, size_t size) {
    if (cancel_.cancelled()) {
      throw DownloadError(ErrorKind::CANCELLED, "interrupted");
    }
    if (received + size > length) {
      throw DownloadError(ErrorKind::PROTOCOL,
                          "server sent more bytes than the requested range");
    }
    task.sink.write(data, size);
    received += size;
    task.bytesTransferred.fetch_add(size, std::memory_order_relaxed);
    session.rateLimiter().consume(size, &cancel_);
  });
  task.sink.close();

  if (received != length) {
    throw DownloadError(ErrorKind::PROTOCOL,
                        "short body: got " + std::to_string(received) + " of " +
                            std::to_string(length) + " bytes");
  }
  uint64_t onDisk = task.sink.existingSize();
  if (onDisk != length) {
    throw DownloadError(ErrorKind::DISK,
                        task.sink.path() + " holds " + std::to_string(onDisk) +
                            " bytes, expected " + std::to_string(length));
  }
}

}  // namespace parfetch
