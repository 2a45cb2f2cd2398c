#ifndef SEGMENT_SINK_HPP_
#define SEGMENT_SINK_HPP_

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

namespace parfetch {

/**
 * @brief 分片的临时文件，析构时负责清理
 *
 * 三种结局：被 Reassembler 消费（consume，文件已删除）、为续传保留
 * （keep）、其余情况在析构时删除。写入失败抛出 DownloadError(DISK)。
 */
class SegmentSink {
 public:
  explicit SegmentSink(std::string path);
  ~SegmentSink();

  SegmentSink(const SegmentSink&) = delete;
  SegmentSink& operator=(const SegmentSink&) = delete;

  const std::string& path() const { return path_; }
  uint64_t existingSize() const;

  void open(bool append);
  void write(const char* data, size_t size);
  void close();

  void consume();
  void keep();
  void discard();
  bool kept() const { return kept_; }

 private:
  std::string path_;
  std::ofstream out_;
  bool kept_;
  bool consumed_;
};

}  // namespace parfetch

#endif  // SEGMENT_SINK_HPP_
