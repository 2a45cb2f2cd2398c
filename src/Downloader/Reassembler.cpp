#include "Reassembler.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

#include "logger.hpp"

namespace parfetch {

Reassembler::Reassembler(size_t bufferSize)
    : bufferSize_(bufferSize > 0 ? bufferSize : 64 * 1024) {}

uint64_t Reassembler::reassemble(TransferSession& session,
                                 const std::string& destination) const {
  std::vector<SegmentTask*> ordered;
  ordered.reserve(session.segments().size());
  for (auto& task : session.segments()) ordered.push_back(task.get());
  std::sort(ordered.begin(), ordered.end(),
            [](const SegmentTask* a, const SegmentTask* b) {
              return a->segment.index < b->segment.index;
            });

  // 不信任调用方，重新检查
  for (const SegmentTask* task : ordered) {
    SegmentState state = task->state.load(std::memory_order_acquire);
    if (state != SegmentState::COMPLETE) {
      throw DownloadError(ErrorKind::INCOMPLETE_TRANSFER,
                          "segment " + std::to_string(task->segment.index) +
                              " is " + segmentStateName(state));
    }
    uint64_t size = task->sink.existingSize();
    if (size != task->segment.length()) {
      throw DownloadError(ErrorKind::INCOMPLETE_TRANSFER,
                          task->sink.path() + " holds " + std::to_string(size) +
                              " bytes, expected " +
                              std::to_string(task->segment.length()));
    }
  }

  // 出错时保留未消费的分片，便于排查
  auto keepRemaining = [&ordered](size_t from) {
    for (size_t i = from; i < ordered.size(); ++i) ordered[i]->sink.keep();
  };

  std::ofstream ofs(destination, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    keepRemaining(0);
    throw DownloadError(ErrorKind::DISK,
                        "Failed to create output file: " + destination);
  }

  std::vector<char> buffer(bufferSize_);
  uint64_t written = 0;
  for (size_t i = 0; i < ordered.size(); ++i) {
    SegmentTask* task = ordered[i];
    std::ifstream ifs(task->sink.path(), std::ios::binary);
    if (!ifs) {
      keepRemaining(i);
      throw DownloadError(ErrorKind::DISK,
                          "Failed to open part file: " + task->sink.path());
    }
    uint64_t copied = 0;
    while (ifs) {
      ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      std::streamsize got = ifs.gcount();
      if (got <= 0) break;
      ofs.write(buffer.data(), got);
      if (!ofs) {
        keepRemaining(i);
        throw DownloadError(ErrorKind::DISK,
                            "Write failed on output file: " + destination);
      }
      copied += static_cast<uint64_t>(got);
    }
    if (ifs.bad() || copied != task->segment.length()) {
      keepRemaining(i);
      throw DownloadError(ErrorKind::DISK,
                          "Failed to read part file: " + task->sink.path());
    }
    ifs.close();
    task->sink.consume();
    written += copied;
  }

  ofs.flush();
  ofs.close();
  if (ofs.fail()) {
    throw DownloadError(ErrorKind::DISK,
                        "Failed to flush output file: " + destination);
  }
  LOG(INFO) << "All " << ordered.size() << " segments merged to "
            << destination << " (" << written << " bytes)";
  return written;
}

}  // namespace parfetch
