#ifndef TBB_MANAGER_HPP_
#define TBB_MANAGER_HPP_

#include <gflags/gflags.h>
#include <tbb/tbb.h>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "logger.hpp"

DECLARE_string(custom_tbb_parallel_control);

namespace utils {

struct TBBState {
  int concurrency = 0;
  std::shared_ptr<tbb::task_arena> arena;
};

/**
 * @brief TBB任务管理器，按名称管理arena
 *
 * 下载分片是 I/O 密集型任务，一个分片占用一个线程；arena 的并发度可以
 * 超过 CPU 核数，因此同时提升 global_control 的线程上限。
 */
class TBBManager {
 public:
  static TBBManager& GetInstance();

  // concurrency <= 0 时使用 gflags 配置或 tbb 默认并发度
  std::shared_ptr<tbb::task_arena> Init(const std::string& tbb_name,
                                        int concurrency = 0);

  // 每个下标作为独立任务执行，[start, end)
  template <typename IntType, typename Func>
  void ParallelFor(const std::string& tbb_name, IntType start, IntType end,
                   const Func& task, int concurrency = 0);

  void Release();
  ~TBBManager();

  static std::map<std::string, int> InitTBBParallelCountDefines();
  static std::map<std::string, int>& GetTBBParallelCountDefines();

 private:
  TBBManager() = default;
  TBBManager(const TBBManager&) = delete;
  TBBManager& operator=(const TBBManager&) = delete;

  uint64_t GenerateUniqueTaskId() const;
  void EnsureParallelism(int concurrency);

  std::unordered_map<std::string, TBBState> task_arenas_;
  std::unique_ptr<tbb::global_control> parallelism_;
  int allowed_parallelism_ = 0;

  mutable std::mutex arenas_mutex_;
};

// 模板实现
template <typename IntType, typename Func>
void TBBManager::ParallelFor(const std::string& tbb_name, IntType start,
                             IntType end, const Func& task, int concurrency) {
  uint64_t task_id = GenerateUniqueTaskId();
  std::string unique_task_name = tbb_name + "_" + std::to_string(task_id);

  auto arena = Init(tbb_name, concurrency);

  LOG(DEBUG) << "[TBBManager] ParallelFor start: " << unique_task_name << " ["
             << start << "," << end << ")";
  arena->execute([&task, start, end]() {
    tbb::parallel_for(
        tbb::blocked_range<IntType>(start, end, 1),
        [&task](const tbb::blocked_range<IntType>& range) {
          for (IntType i = range.begin(); i < range.end(); ++i) {
            try {
              task(i);
            } catch (const std::exception& e) {
              LOG(ERROR) << "[TBBManager] Exception in task " << i << ": "
                         << e.what();
            }
          }
        },
        tbb::simple_partitioner());
  });
  LOG(DEBUG) << "[TBBManager] ParallelFor end: " << unique_task_name;
}

}  // namespace utils

#endif  // TBB_MANAGER_HPP_
