#include "Prober.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "DownloadError.hpp"
#include "UrlValidator.hpp"
#include "logger.hpp"

namespace parfetch {

namespace {

std::string lookup(const HeaderMap& headers, const std::string& name) {
  auto it = headers.find(name);
  return it == headers.end() ? "" : it->second;
}

std::string stripQuotes(std::string value) {
  auto first = value.find_first_not_of(" \t\"'");
  if (first == std::string::npos) return "";
  auto last = value.find_last_not_of(" \t\"'");
  return value.substr(first, last - first + 1);
}

// 去掉目录部分，防止 "../../etc/passwd" 这类文件名
std::string baseName(const std::string& name) {
  auto slash = name.find_last_of("/\\");
  std::string base = slash == std::string::npos ? name : name.substr(slash + 1);
  if (base == "." || base == "..") return "";
  return base;
}

std::string filenameFromDisposition(const std::string& disposition) {
  std::string lower(disposition);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  // RFC 5987: filename*=UTF-8''name%20with%20spaces
  auto pos = lower.find("filename*=");
  if (pos != std::string::npos) {
    std::string value = disposition.substr(pos + 10);
    value = stripQuotes(value.substr(0, value.find(';')));
    auto quote = value.find("''");
    if (quote != std::string::npos) value = value.substr(quote + 2);
    std::string name = baseName(urlDecode(value));
    if (!name.empty()) return name;
  }

  pos = lower.find("filename=");
  if (pos == std::string::npos) return "";
  std::string value = disposition.substr(pos + 9);
  value = stripQuotes(value.substr(0, value.find(';')));
  return baseName(urlDecode(value));
}

std::string timestampName() {
  auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm;
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << "download_" << std::put_time(&tm, "%Y%m%d_%H%M%S");
  return oss.str();
}

}  // namespace

std::string deriveFilename(const std::string& url, const HeaderMap& headers) {
  std::string disposition = lookup(headers, "content-disposition");
  if (!disposition.empty()) {
    std::string name = filenameFromDisposition(disposition);
    if (!name.empty()) return name;
  }

  ParsedUrl parsed;
  if (parseUrl(url, &parsed)) {
    auto slash = parsed.path.find_last_of('/');
    std::string last =
        slash == std::string::npos ? parsed.path : parsed.path.substr(slash + 1);
    std::string name = baseName(urlDecode(last));
    if (!name.empty()) return name;
  }

  return timestampName();
}

std::string formatSize(uint64_t size) {
  if (size == 0) return "Unknown";
  static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  double value = static_cast<double>(size);
  size_t unit = 0;
  while (value >= 1024.0 && unit < 4) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << value << " " << units[unit];
  return oss.str();
}

Prober::Prober(Transport& transport, const CancellationToken* cancel)
    : transport_(transport), cancel_(cancel) {}

ProbeResult Prober::probe(const std::string& url) const {
  HeadResponse head = transport_.head(url, cancel_);
  if (head.status < 200 || head.status >= 300) {
    throw DownloadError(ErrorKind::PROTOCOL,
                        url + ": probe answered HTTP " +
                            std::to_string(head.status));
  }

  ProbeResult result;
  result.sizeKnown = head.hasContentLength;
  result.totalSize = head.hasContentLength ? head.contentLength : 0;

  std::string value = lookup(head.headers, "content-type");
  if (!value.empty()) result.contentType = value;
  value = lookup(head.headers, "last-modified");
  if (!value.empty()) result.lastModified = value;
  result.etag = lookup(head.headers, "etag");
  value = lookup(head.headers, "server");
  if (!value.empty()) result.server = value;

  std::string ranges = lookup(head.headers, "accept-ranges");
  std::transform(ranges.begin(), ranges.end(), ranges.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  result.rangeSupport =
      head.headers.count("accept-ranges") > 0 && ranges != "none";

  result.filename = deriveFilename(url, head.headers);

  LOG(INFO) << "Probed " << url << ": size=" << formatSize(result.totalSize)
            << " type=" << result.contentType << " server=" << result.server
            << " ranges=" << (result.rangeSupport ? "yes" : "no")
            << " filename=" << result.filename;
  return result;
}

}  // namespace parfetch
