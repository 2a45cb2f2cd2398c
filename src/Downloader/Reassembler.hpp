#ifndef REASSEMBLER_HPP_
#define REASSEMBLER_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

#include "TransferSession.hpp"

namespace parfetch {

class Reassembler {
 public:
  explicit Reassembler(size_t bufferSize = 1024 * 1024);

  /**
   * @brief 按 index 顺序把分片文件拼接到 destination，每拼完一个就删除它
   *
   * 自行检查所有分片均为 COMPLETE 且文件长度正确，否则抛出
   * DownloadError(INCOMPLETE_TRANSFER)，此时不触碰目标文件。
   * 拷贝中途出错抛出 DownloadError(DISK)，已写入的目标文件和尚未消费的
   * 分片文件都保留在磁盘上。
   *
   * @return 写入目标文件的字节数
   */
  uint64_t reassemble(TransferSession& session,
                      const std::string& destination) const;

 private:
  size_t bufferSize_;
};

}  // namespace parfetch

#endif  // REASSEMBLER_HPP_
