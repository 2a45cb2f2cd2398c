#include "CurlTransport.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <memory>
#include <mutex>

#include "DownloadError.hpp"
#include "logger.hpp"

namespace parfetch {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

CurlHandle makeHandle() {
  static std::once_flag init_once;
  std::call_once(init_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  CurlHandle handle(curl_easy_init(), &curl_easy_cleanup);
  if (!handle) {
    throw DownloadError(ErrorKind::NETWORK, "curl_easy_init failed");
  }
  return handle;
}

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

bool isHttpUrl(const std::string& url) {
  std::string lower = toLower(url.substr(0, 8));
  return lower.compare(0, 7, "http://") == 0 ||
         lower.compare(0, 8, "https://") == 0;
}

// 非 HTTP 协议（ftp/ftps/sftp）的应答码与 HTTP 不可比，统一成 200/206
long responseStatus(CURL* curl, bool http, bool ranged) {
  if (!http) return ranged ? 206 : 200;
  long code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
  return code;
}

// 头回调
size_t onHeader(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* headers = static_cast<HeaderMap*>(userdata);
  size_t len = size * nitems;
  std::string line(buffer, len);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
    line.pop_back();
  }
  if (line.compare(0, 5, "HTTP/") == 0) {
    headers->clear();  // 重定向后的新响应
    return len;
  }
  auto colon = line.find(':');
  if (colon == std::string::npos) return len;
  std::string name = toLower(line.substr(0, colon));
  auto first = line.find_first_not_of(" \t", colon + 1);
  std::string value = first == std::string::npos ? "" : line.substr(first);
  (*headers)[name] = value;
  return len;
}

struct WriteContext {
  CURL* curl;
  const ChunkHandler* handler;
  long expectedStatus;
  bool http;
  bool ranged;
  bool statusChecked;
  uint64_t bytes;
  std::exception_ptr error;
};

// 写入回调；异常不能穿过 libcurl，先保存，perform 返回后再抛出
size_t onWrite(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* ctx = static_cast<WriteContext*>(userdata);
  size_t len = size * nmemb;
  try {
    if (!ctx->statusChecked) {
      ctx->statusChecked = true;
      long status = responseStatus(ctx->curl, ctx->http, ctx->ranged);
      if (ctx->expectedStatus != 0 && status != ctx->expectedStatus) {
        throw DownloadError(ErrorKind::PROTOCOL,
                            "expected status " +
                                std::to_string(ctx->expectedStatus) +
                                " but server answered " + std::to_string(status));
      }
    }
    (*ctx->handler)(ptr, len);
    ctx->bytes += len;
    return len;
  } catch (...) {
    ctx->error = std::current_exception();
    return 0;
  }
}

// 连接或等待服务端期间没有数据写入，靠进度回调轮询取消标志
int onProgress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto* cancel = static_cast<const CancellationToken*>(clientp);
  return cancel->cancelled() ? 1 : 0;
}

void applyCancellation(CURL* curl, const CancellationToken* cancel) {
  if (!cancel) return;
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, onProgress);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA,
                   const_cast<CancellationToken*>(cancel));
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
}

ErrorKind classify(CURLcode code) {
  switch (code) {
    case CURLE_ABORTED_BY_CALLBACK:
      return ErrorKind::CANCELLED;
    case CURLE_TOO_MANY_REDIRECTS:
    case CURLE_HTTP_RETURNED_ERROR:
    case CURLE_RANGE_ERROR:
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_URL_MALFORMAT:
    case CURLE_WEIRD_SERVER_REPLY:
      return ErrorKind::PROTOCOL;
    case CURLE_WRITE_ERROR:
      return ErrorKind::DISK;
    default:
      return ErrorKind::NETWORK;
  }
}

[[noreturn]] void throwCurlError(CURL* curl, CURLcode code, const char* errbuf,
                                 const std::string& url) {
  std::string message = errbuf[0] ? errbuf : curl_easy_strerror(code);
  if (code == CURLE_ABORTED_BY_CALLBACK) {
    message = "interrupted";
  } else if (code == CURLE_HTTP_RETURNED_ERROR) {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    message = "HTTP " + std::to_string(status);
  }
  throw DownloadError(classify(code), url + ": " + message);
}

void applyCommonOptions(CURL* curl, const std::string& url,
                        const TransportOptions& options, char* errbuf) {
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options.maxRedirects);
  curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                   static_cast<long>(options.timeoutSec));
  // 连续 timeoutSec 秒没有数据即视为超时
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                   static_cast<long>(options.timeoutSec));
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verifyTls ? 1L : 0L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verifyTls ? 2L : 0L);
  if (!options.userAgent.empty()) {
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.c_str());
  }
  if (!options.proxy.url.empty()) {
    curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy.url.c_str());
    if (!options.proxy.username.empty()) {
      curl_easy_setopt(curl, CURLOPT_PROXYUSERNAME,
                       options.proxy.username.c_str());
      curl_easy_setopt(curl, CURLOPT_PROXYPASSWORD,
                       options.proxy.password.c_str());
    }
  }
  long buffer = static_cast<long>(
      std::min<size_t>(options.bufferSize, CURL_MAX_READ_SIZE));
  curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, buffer);
  if (options.uploadRateLimitBps > 0) {
    curl_easy_setopt(curl, CURLOPT_MAX_SEND_SPEED_LARGE,
                     static_cast<curl_off_t>(options.uploadRateLimitBps));
  }
}

}  // namespace

TransportOptions TransportOptions::fromConfig(const DownloadConfig& config) {
  TransportOptions options;
  options.timeoutSec = config.timeoutSec;
  options.verifyTls = config.verifyTls;
  options.userAgent = config.userAgent;
  options.proxy = config.proxy;
  options.uploadRateLimitBps = config.uploadRateLimitBps;
  options.bufferSize = config.chunkSize;
  return options;
}

CurlTransport::CurlTransport(const TransportOptions& options)
    : options_(options) {}

HeadResponse CurlTransport::head(const std::string& url,
                                 const CancellationToken* cancel) {
  CurlHandle handle = makeHandle();
  CURL* curl = handle.get();
  char errbuf[CURL_ERROR_SIZE] = {0};
  HeaderMap headers;

  applyCommonOptions(curl, url, options_, errbuf);
  curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options_.timeoutSec));
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, onHeader);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &headers);
  applyCancellation(curl, cancel);

  LOG(DEBUG) << "HEAD " << url;
  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    throwCurlError(curl, res, errbuf, url);
  }

  bool http = isHttpUrl(url);
  HeadResponse response;
  response.status = responseStatus(curl, http, false);
  curl_off_t length = -1;
  curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
  if (length >= 0) {
    response.hasContentLength = true;
    response.contentLength = static_cast<uint64_t>(length);
  }
  if (!http && response.hasContentLength) {
    headers.emplace("accept-ranges", "bytes");  // FTP 通过 REST 支持断点
  }
  response.headers = std::move(headers);
  return response;
}

FetchResponse CurlTransport::fetch(const FetchRequest& request,
                                   const ChunkHandler& onChunk) {
  CurlHandle handle = makeHandle();
  CURL* curl = handle.get();
  char errbuf[CURL_ERROR_SIZE] = {0};

  applyCommonOptions(curl, request.url, options_, errbuf);
  std::string range = formatRange(request);
  if (!range.empty()) {
    curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
  }

  WriteContext ctx{curl, &onChunk, request.expectedStatus,
                   isHttpUrl(request.url), !range.empty(), false, 0, nullptr};
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, onWrite);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
  applyCancellation(curl, request.cancel);

  LOG(DEBUG) << "GET " << request.url << (range.empty() ? "" : " range=")
             << range;
  CURLcode res = curl_easy_perform(curl);
  if (ctx.error) {
    std::rethrow_exception(ctx.error);
  }
  if (res != CURLE_OK) {
    throwCurlError(curl, res, errbuf, request.url);
  }

  FetchResponse response;
  response.status = responseStatus(curl, ctx.http, ctx.ranged);
  response.bodyBytes = ctx.bytes;
  if (!ctx.statusChecked && request.expectedStatus != 0 &&
      response.status != request.expectedStatus) {
    throw DownloadError(ErrorKind::PROTOCOL,
                        request.url + ": expected status " +
                            std::to_string(request.expectedStatus) +
                            " but server answered " +
                            std::to_string(response.status));
  }
  return response;
}

}  // namespace parfetch
