#include "UrlValidator.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <new>

namespace parfetch {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

bool endsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

using CurlUrl = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

// 部件不存在时返回空串
std::string urlPart(CURLU* handle, CURLUPart part) {
  char* value = nullptr;
  if (curl_url_get(handle, part, &value, 0) != CURLUE_OK || !value) return "";
  std::string result(value);
  curl_free(value);
  return result;
}

// 语法解析交给 libcurl；不在内置协议列表中的 scheme 也放行，由策略判断
CURLUcode parseWithCurl(const std::string& url, ParsedUrl* out) {
  CurlUrl handle(curl_url(), &curl_url_cleanup);
  if (!handle) return CURLUE_OUT_OF_MEMORY;
  CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(),
                              CURLU_NON_SUPPORT_SCHEME);
  if (rc != CURLUE_OK) return rc;

  ParsedUrl parsed;
  parsed.scheme = toLower(urlPart(handle.get(), CURLUPART_SCHEME));
  parsed.host = toLower(urlPart(handle.get(), CURLUPART_HOST));
  if (parsed.host.size() > 1 && parsed.host.front() == '[' &&
      parsed.host.back() == ']') {
    parsed.host = parsed.host.substr(1, parsed.host.size() - 2);
  }
  parsed.port = urlPart(handle.get(), CURLUPART_PORT);
  parsed.path = urlPart(handle.get(), CURLUPART_PATH);
  if (out) *out = parsed;
  return CURLUE_OK;
}

}  // namespace

UrlPolicy UrlPolicy::fromConfig(const DownloadConfig& config) {
  UrlPolicy policy;
  policy.allowedSchemes = config.allowedSchemes;
  policy.blockedExtensions = config.blockedExtensions;
  policy.blockedHosts = config.blockedHosts;
  return policy;
}

bool parseUrl(const std::string& url, ParsedUrl* out) {
  return parseWithCurl(url, out) == CURLUE_OK;
}

std::string urlDecode(const std::string& value) {
  int length = 0;
  char* decoded = curl_easy_unescape(nullptr, value.c_str(),
                                     static_cast<int>(value.size()), &length);
  if (!decoded) throw std::bad_alloc();
  std::string result(decoded, static_cast<size_t>(length));
  curl_free(decoded);
  return result;
}

ValidationResult validateUrl(const std::string& url, const UrlPolicy& policy) {
  ParsedUrl parsed;
  CURLUcode rc = parseWithCurl(url, &parsed);
  if (rc == CURLUE_NO_HOST) {
    return {ValidationStatus::MISSING_HOST, "Invalid hostname"};
  }
  if (rc != CURLUE_OK) {
    return {ValidationStatus::MALFORMED,
            "Malformed URL: '" + url + "' (" + curl_url_strerror(rc) + ")"};
  }

  bool schemeAllowed = std::any_of(
      policy.allowedSchemes.begin(), policy.allowedSchemes.end(),
      [&](const std::string& s) { return toLower(s) == parsed.scheme; });
  if (!schemeAllowed) {
    return {ValidationStatus::DISALLOWED_SCHEME,
            "Protocol '" + parsed.scheme + "' not allowed"};
  }

  if (parsed.host.empty()) {
    return {ValidationStatus::MISSING_HOST, "Invalid hostname"};
  }

  for (const auto& blocked : policy.blockedHosts) {
    if (toLower(blocked) == parsed.host) {
      return {ValidationStatus::BLOCKED_HOST,
              "Host '" + parsed.host + "' is blocked"};
    }
  }

  std::string path = toLower(urlDecode(parsed.path));
  for (const auto& ext : policy.blockedExtensions) {
    if (!ext.empty() && endsWith(path, toLower(ext))) {
      return {ValidationStatus::BLOCKED_EXTENSION, "Blocked file type: " + ext};
    }
  }
  return {ValidationStatus::OK, "Valid URL"};
}

}  // namespace parfetch
