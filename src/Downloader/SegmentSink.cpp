#include "SegmentSink.hpp"

#include <filesystem>

#include "DownloadError.hpp"
#include "fs_utils.hpp"
#include "logger.hpp"

namespace parfetch {

SegmentSink::SegmentSink(std::string path)
    : path_(std::move(path)), kept_(false), consumed_(false) {}

SegmentSink::~SegmentSink() {
  if (out_.is_open()) out_.close();
  if (!kept_ && !consumed_) discard();
}

uint64_t SegmentSink::existingSize() const {
  return utils::fileSizeOrZero(path_);
}

void SegmentSink::open(bool append) {
  kept_ = false;
  consumed_ = false;
  out_.open(path_, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
  if (!out_) {
    throw DownloadError(ErrorKind::DISK, "Failed to open part file: " + path_);
  }
}

void SegmentSink::write(const char* data, size_t size) {
  out_.write(data, static_cast<std::streamsize>(size));
  if (!out_) {
    throw DownloadError(ErrorKind::DISK, "Write failed on part file: " + path_);
  }
}

void SegmentSink::close() {
  if (!out_.is_open()) return;
  out_.flush();
  bool ok = static_cast<bool>(out_);
  out_.close();
  if (!ok || out_.fail()) {
    throw DownloadError(ErrorKind::DISK, "Failed to flush part file: " + path_);
  }
}

void SegmentSink::consume() {
  if (out_.is_open()) out_.close();
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    LOG(WARN) << "Failed to remove part file " << path_ << ": " << ec.message();
  }
  consumed_ = true;
}

void SegmentSink::keep() { kept_ = true; }

void SegmentSink::discard() {
  if (out_.is_open()) out_.close();
  std::error_code ec;
  if (std::filesystem::remove(path_, ec)) {
    LOG(DEBUG) << "Removed part file " << path_;
  } else if (ec) {
    LOG(WARN) << "Failed to remove part file " << path_ << ": " << ec.message();
  }
  kept_ = false;
  consumed_ = true;
}

}  // namespace parfetch
