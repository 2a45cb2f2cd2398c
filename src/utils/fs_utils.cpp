#include "fs_utils.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace utils {

uint64_t fileSizeOrZero(const std::string& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) return 0;
  auto size = fs::file_size(path, ec);
  return ec ? 0 : static_cast<uint64_t>(size);
}

bool fileExists(const std::string& path) {
  std::error_code ec;
  return fs::exists(path, ec);
}

uint64_t availableSpace(const std::string& dir) {
  std::error_code ec;
  fs::path probe = fs::absolute(dir, ec);
  if (ec) probe = dir;
  while (!probe.empty() && !fs::exists(probe, ec)) {
    if (probe == probe.parent_path()) break;
    probe = probe.parent_path();
  }
  auto info = fs::space(probe, ec);
  if (ec) {
    throw fs::filesystem_error("cannot query free space", probe, ec);
  }
  return static_cast<uint64_t>(info.available);
}

std::string uniquePath(const std::string& path) {
  if (!fileExists(path)) return path;
  fs::path p(path);
  fs::path dir = p.parent_path();
  std::string stem = p.stem().string();
  std::string ext = p.extension().string();
  for (int counter = 1;; ++counter) {
    fs::path candidate = dir / (stem + "_" + std::to_string(counter) + ext);
    if (!fileExists(candidate.string())) return candidate.string();
  }
}

std::string joinPath(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  return (fs::path(dir) / name).string();
}

}  // namespace utils
