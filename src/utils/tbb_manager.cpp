#include "tbb_manager.hpp"

#include <algorithm>
#include <atomic>
#include <sstream>

namespace utils {

namespace {
std::atomic<uint64_t> global_task_id{0};
}  // namespace

TBBManager& TBBManager::GetInstance() {
  static TBBManager instance;
  return instance;
}

std::shared_ptr<tbb::task_arena> TBBManager::Init(const std::string& tbb_name,
                                                  int concurrency) {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  if (concurrency <= 0) {
    auto& defines = GetTBBParallelCountDefines();
    auto it = defines.find(tbb_name);
    if (it != defines.end()) {
      concurrency = it->second;
    }
  }
  if (concurrency <= 0) {
    concurrency = tbb::info::default_concurrency();
  }

  auto& state = task_arenas_[tbb_name];
  // 并发度不足时重建 arena；旧 arena 由仍在使用它的调用方持有直到结束
  if (!state.arena || state.concurrency < concurrency) {
    EnsureParallelism(concurrency);
    state.arena = std::make_shared<tbb::task_arena>(concurrency);
    state.concurrency = concurrency;
    LOG(DEBUG) << "[TBBManager] Arena '" << tbb_name
               << "' initialized with concurrency: " << concurrency;
  }
  return state.arena;
}

void TBBManager::EnsureParallelism(int concurrency) {
  // arena 的主线程占一个槽位，worker 线程需要 concurrency 个
  int wanted = std::max(concurrency + 1, tbb::info::default_concurrency());
  if (wanted <= allowed_parallelism_) return;
  parallelism_.reset();
  parallelism_ = std::make_unique<tbb::global_control>(
      tbb::global_control::max_allowed_parallelism,
      static_cast<size_t>(wanted));
  allowed_parallelism_ = wanted;
}

void TBBManager::Release() {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  for (auto& kv : task_arenas_) {
    if (kv.second.arena) {
      kv.second.arena->terminate();
      kv.second.arena.reset();
      kv.second.concurrency = 0;
      LOG(DEBUG) << "[TBBManager] Arena '" << kv.first << "' released.";
    }
  }
  task_arenas_.clear();
  parallelism_.reset();
  allowed_parallelism_ = 0;
}

TBBManager::~TBBManager() { Release(); }

std::map<std::string, int> TBBManager::InitTBBParallelCountDefines() {
  std::map<std::string, int> defines;
  // 解析gflags字符串，格式如 "segments:8,other:4"
  std::string cfg = FLAGS_custom_tbb_parallel_control;
  std::istringstream ss(cfg);
  std::string item;
  while (std::getline(ss, item, ',')) {
    auto pos = item.find(':');
    if (pos == std::string::npos) continue;
    std::string name = item.substr(0, pos);
    try {
      defines[name] = std::stoi(item.substr(pos + 1));
    } catch (const std::exception& e) {
      LOG(WARN) << "[TBBManager] Ignoring bad arena setting '" << item
                << "': " << e.what();
    }
  }
  return defines;
}

std::map<std::string, int>& TBBManager::GetTBBParallelCountDefines() {
  static std::map<std::string, int> defines = InitTBBParallelCountDefines();
  return defines;
}

uint64_t TBBManager::GenerateUniqueTaskId() const {
  return global_task_id.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace utils
