#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace utils {

namespace {
std::mutex log_mutex;
std::ofstream log_file;
std::string log_dir = "logs";
std::string log_name = "parfetch.log";
std::string log_file_path;
size_t max_file_size = 10 * 1024 * 1024;  // 10MB
size_t max_backup_files = 3;
LogLevel min_level = LogLevel::INFO;
bool to_console = true;

const char* getLevelStr(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::FATAL:
      return "FATAL";
    default:
      return "UNKNOWN";
  }
}

std::string getCurrentTime() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm tm;
#ifdef _WIN32
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0')
      << std::setw(3) << ms.count();
  return oss.str();
}

// 只保留文件名，去掉编译期的绝对路径
const char* baseName(const char* file) {
  const char* slash = file;
  for (const char* p = file; *p; ++p) {
    if (*p == '/' || *p == '\\') slash = p + 1;
  }
  return slash;
}

void rotateLogsIfNeeded() {
  std::error_code ec;
  if (log_file_path.empty() || !std::filesystem::exists(log_file_path, ec) ||
      std::filesystem::file_size(log_file_path, ec) < max_file_size) {
    return;
  }
  log_file.close();
  for (int i = static_cast<int>(max_backup_files) - 1; i >= 0; --i) {
    std::string old_name =
        log_file_path + (i == 0 ? "" : ("." + std::to_string(i)));
    std::string new_name = log_file_path + "." + std::to_string(i + 1);
    if (std::filesystem::exists(old_name, ec)) {
      std::filesystem::rename(old_name, new_name, ec);
    }
  }
  log_file.open(log_file_path, std::ios::trunc);
}

void openLogFile() {
  std::error_code ec;
  std::filesystem::create_directories(log_dir, ec);
  log_file_path = log_dir + "/" + log_name;
  log_file.open(log_file_path, std::ios::app);
  if (!log_file.is_open()) {
    std::cerr << "Failed to open log file: " << log_file_path << std::endl;
  }
}
}  // namespace

LogLevel parseLogLevel(const std::string& name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") return LogLevel::DEBUG;
  if (lower == "warn" || lower == "warning") return LogLevel::WARN;
  if (lower == "error") return LogLevel::ERROR;
  if (lower == "fatal") return LogLevel::FATAL;
  return LogLevel::INFO;
}

void Logger::initialize(const LogConfig& config) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file.is_open()) log_file.close();
  log_dir = config.logFilePath.empty() ? "logs" : config.logFilePath;
  log_name = config.logFileName.empty() ? "parfetch.log" : config.logFileName;
  max_file_size = config.maxFileSize ? config.maxFileSize : 10 * 1024 * 1024;
  max_backup_files = config.maxBackupFiles ? config.maxBackupFiles : 3;
  min_level = config.minLevel;
  to_console = config.logToConsole;
  openLogFile();
}

bool Logger::isEnabled(LogLevel level) {
  std::lock_guard<std::mutex> lock(log_mutex);
  return level >= min_level;
}

Logger::LogStream::LogStream(LogLevel level, const char* file, const char* func,
                             int line)
    : level_(level), enabled_(Logger::isEnabled(level)), oss_() {
  if (!enabled_) return;
  oss_ << "[" << getLevelStr(level) << "] " << getCurrentTime() << " "
       << baseName(file) << ":" << line << " " << func << ": ";
}

Logger::LogStream::~LogStream() {
  if (!enabled_) return;
  oss_ << "\n";
  std::string msg = oss_.str();
  {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_file.is_open()) openLogFile();
    rotateLogsIfNeeded();
    if (to_console || level_ >= LogLevel::ERROR) std::clog << msg;
    if (log_file.is_open()) log_file << msg, log_file.flush();
  }
}

}  // namespace utils
