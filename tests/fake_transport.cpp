#include "fake_transport.hpp"

#include <algorithm>

using parfetch::DownloadError;
using parfetch::ErrorKind;

FakeTransport::FakeTransport(std::string body) : body_(std::move(body)) {}

void FakeTransport::setHeader(const std::string& name, const std::string& value) {
  extraHeaders_[name] = value;
}

void FakeTransport::failHead(ErrorKind kind) {
  headFails_ = true;
  headFailure_ = kind;
}

void FakeTransport::failRange(uint64_t start, ErrorKind kind,
                              uint64_t afterBytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_[start] = Failure{kind, afterBytes};
}

void FakeTransport::clearFailures() {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_.clear();
}

void FakeTransport::setOnFetch(
    std::function<void(const parfetch::FetchRequest&)> hook) {
  onFetch_ = std::move(hook);
}

parfetch::HeadResponse FakeTransport::head(
    const std::string& url, const parfetch::CancellationToken* cancel) {
  ++headCount_;
  if (cancel && cancel->cancelled()) {
    throw DownloadError(ErrorKind::CANCELLED, url + ": HEAD cancelled");
  }
  if (headFails_) {
    throw DownloadError(headFailure_, url + ": injected probe failure");
  }
  parfetch::HeadResponse response;
  response.status = headStatus_;
  response.headers = extraHeaders_;
  if (advertiseLength_) {
    response.hasContentLength = true;
    response.contentLength = body_.size();
    response.headers["content-length"] = std::to_string(body_.size());
  }
  if (rangeSupport_) response.headers["accept-ranges"] = "bytes";
  return response;
}

parfetch::FetchResponse FakeTransport::fetch(
    const parfetch::FetchRequest& request,
    const parfetch::ChunkHandler& onChunk) {
  ++fetchCount_;
  Failure failure{ErrorKind::NONE, 0};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    uint64_t key = request.rangeStart ? *request.rangeStart : 0;
    auto it = failures_.find(key);
    if (it != failures_.end()) failure = it->second;
  }
  if (onFetch_) onFetch_(request);
  if (request.cancel && request.cancel->cancelled()) {
    throw DownloadError(ErrorKind::CANCELLED, request.url + ": fetch cancelled");
  }

  uint64_t start = 0;
  uint64_t end = body_.empty() ? 0 : body_.size() - 1;
  long status = 200;
  if (request.rangeStart && !ignoreRanges_) {
    start = *request.rangeStart;
    if (start >= body_.size()) {
      throw DownloadError(ErrorKind::PROTOCOL, "HTTP 416");
    }
    if (request.rangeEnd) end = std::min<uint64_t>(*request.rangeEnd, end);
    status = 206;
  }
  if (request.expectedStatus != 0 && status != request.expectedStatus) {
    throw DownloadError(ErrorKind::PROTOCOL,
                        "expected status " +
                            std::to_string(request.expectedStatus) + " got " +
                            std::to_string(status));
  }

  parfetch::FetchResponse response;
  response.status = status;
  if (body_.empty()) return response;

  uint64_t pos = start;
  while (pos <= end) {
    if (failure.kind != ErrorKind::NONE &&
        response.bodyBytes >= failure.afterBytes) {
      throw DownloadError(failure.kind, "injected failure at " +
                                            std::to_string(pos));
    }
    uint64_t n = std::min<uint64_t>(chunkSize_, end - pos + 1);
    if (failure.kind != ErrorKind::NONE) {
      n = std::min<uint64_t>(n, failure.afterBytes - response.bodyBytes);
    }
    onChunk(body_.data() + pos, static_cast<size_t>(n));
    pos += n;
    response.bodyBytes += n;
  }
  if (failure.kind != ErrorKind::NONE) {
    throw DownloadError(failure.kind, "injected failure at end of body");
  }
  return response;
}

std::vector<parfetch::FetchRequest> FakeTransport::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}
