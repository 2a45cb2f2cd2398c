#include "IntegrityVerifier.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <vector>

#include "DownloadError.hpp"
#include "fs_utils.hpp"
#include "logger.hpp"

namespace parfetch {

namespace {

constexpr size_t kReadChunk = 64 * 1024;

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string normalize(const std::string& value) {
  auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return "";
  auto last = value.find_last_not_of(" \t\r\n");
  std::string out = value.substr(first, last - first + 1);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

}  // namespace

IntegrityVerifier::IntegrityVerifier(bool enabled, uint64_t maxBytes)
    : enabled_(enabled), maxBytes_(maxBytes) {}

std::optional<std::string> IntegrityVerifier::digest(
    const std::string& path) const {
  if (!enabled_) return std::nullopt;
  uint64_t size = utils::fileSizeOrZero(path);
  if (maxBytes_ > 0 && size > maxBytes_) {
    LOG(INFO) << "Skipping SHA-256 of " << path << ": " << size
              << " bytes exceeds " << maxBytes_;
    return std::nullopt;
  }
  return sha256File(path);
}

std::string IntegrityVerifier::sha256File(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw DownloadError(ErrorKind::DISK, "Failed to open for hashing: " + path);
  }

  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || 1 != EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
    throw DownloadError(ErrorKind::INTEGRITY, "EVP_DigestInit_ex failed");
  }

  std::vector<char> buff(kReadChunk);
  while (in) {
    in.read(buff.data(), static_cast<std::streamsize>(buff.size()));
    std::streamsize got = in.gcount();
    if (got <= 0) break;
    if (1 != EVP_DigestUpdate(ctx.get(), buff.data(), static_cast<size_t>(got))) {
      throw DownloadError(ErrorKind::INTEGRITY, "EVP_DigestUpdate failed");
    }
  }
  if (in.bad()) {
    throw DownloadError(ErrorKind::DISK, "Read failed while hashing: " + path);
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (1 != EVP_DigestFinal_ex(ctx.get(), digest, &hash_len)) {
    throw DownloadError(ErrorKind::INTEGRITY, "EVP_DigestFinal_ex failed");
  }

  static const char* hex = "0123456789abcdef";
  std::string out;
  out.reserve(hash_len * 2);
  for (unsigned int i = 0; i < hash_len; ++i) {
    out.push_back(hex[digest[i] >> 4]);
    out.push_back(hex[digest[i] & 0x0f]);
  }
  return out;
}

bool IntegrityVerifier::matches(const std::string& digest,
                                const std::string& expected) {
  return normalize(digest) == normalize(expected);
}

}  // namespace parfetch
