#pragma once

#include <cstdint>
#include <string>

namespace utils {

// 文件不存在或无法读取时返回 0
uint64_t fileSizeOrZero(const std::string& path);

bool fileExists(const std::string& path);

// 目录所在文件系统的可用字节数，目录不存在时向上查找已存在的父目录
uint64_t availableSpace(const std::string& dir);

// "dir/name.ext" 已存在时依次尝试 "dir/name_1.ext"、"dir/name_2.ext" ...
std::string uniquePath(const std::string& path);

std::string joinPath(const std::string& dir, const std::string& name);

}  // namespace utils
