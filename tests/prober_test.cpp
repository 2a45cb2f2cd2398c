#include <gtest/gtest.h>

#include "DownloadError.hpp"
#include "Prober.hpp"
#include "fake_transport.hpp"

using namespace parfetch;

TEST(ProberTest, ReadsSizeRangeSupportAndMetadata) {
  FakeTransport transport(std::string(2048, 'x'));
  transport.setHeader("content-type", "application/zip");
  transport.setHeader("server", "nginx");
  transport.setHeader("etag", "\"abc123\"");
  Prober prober(transport);

  ProbeResult result = prober.probe("https://example.com/pkg/archive.zip");
  EXPECT_TRUE(result.sizeKnown);
  EXPECT_EQ(result.totalSize, 2048u);
  EXPECT_TRUE(result.rangeSupport);
  EXPECT_EQ(result.contentType, "application/zip");
  EXPECT_EQ(result.server, "nginx");
  EXPECT_EQ(result.lastModified, "unknown");
  EXPECT_EQ(result.etag, "\"abc123\"");
  EXPECT_EQ(result.filename, "archive.zip");
}

TEST(ProberTest, MissingHeadersMeanUnknownSizeAndNoRanges) {
  FakeTransport transport("abc");
  transport.setAdvertiseLength(false);
  transport.setRangeSupport(false);
  Prober prober(transport);

  ProbeResult result = prober.probe("https://example.com/a.bin");
  EXPECT_FALSE(result.sizeKnown);
  EXPECT_EQ(result.totalSize, 0u);
  EXPECT_FALSE(result.rangeSupport);
  EXPECT_EQ(result.contentType, "unknown");
}

TEST(ProberTest, AcceptRangesNoneDisablesRanges) {
  FakeTransport transport("abc");
  transport.setRangeSupport(false);
  transport.setHeader("accept-ranges", "none");
  Prober prober(transport);
  EXPECT_FALSE(prober.probe("https://example.com/a.bin").rangeSupport);
}

TEST(ProberTest, CancelledTokenStopsHeadRequest) {
  FakeTransport transport("abc");
  CancellationToken cancel;
  cancel.cancel();
  try {
    Prober(transport, &cancel).probe("https://example.com/a.bin");
    FAIL() << "probe should throw";
  } catch (const DownloadError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::CANCELLED);
  }
}

TEST(ProberTest, NonSuccessStatusIsProtocolError) {
  FakeTransport transport("abc");
  transport.setHeadStatus(404);
  Prober prober(transport);
  try {
    prober.probe("https://example.com/missing.bin");
    FAIL() << "probe should throw";
  } catch (const DownloadError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::PROTOCOL);
  }
}

TEST(ProberTest, TransportFailurePropagatesUnretried) {
  FakeTransport transport("abc");
  transport.failHead(ErrorKind::NETWORK);
  Prober prober(transport);
  try {
    prober.probe("https://example.com/a.bin");
    FAIL() << "probe should throw";
  } catch (const DownloadError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::NETWORK);
  }
  EXPECT_EQ(transport.headCount(), 1u);
}

TEST(DeriveFilenameTest, PrefersContentDisposition) {
  HeaderMap headers;
  headers["content-disposition"] = "attachment; filename=\"report.pdf\"";
  EXPECT_EQ(deriveFilename("https://example.com/download?id=3", headers),
            "report.pdf");

  headers["content-disposition"] =
      "attachment; filename=\"fallback.txt\"; filename*=UTF-8''na%C3%AFve%20file.txt";
  EXPECT_EQ(deriveFilename("https://example.com/x", headers),
            "na\xC3\xAFve file.txt");
}

TEST(DeriveFilenameTest, StripsDirectoriesFromDisposition) {
  HeaderMap headers;
  headers["content-disposition"] = "attachment; filename=\"../../etc/passwd\"";
  EXPECT_EQ(deriveFilename("https://example.com/x", headers), "passwd");
}

TEST(DeriveFilenameTest, FallsBackToDecodedPathSegment) {
  EXPECT_EQ(deriveFilename("https://example.com/dir/my%20file.iso?x=1", {}),
            "my file.iso");
}

TEST(DeriveFilenameTest, FallsBackToTimestampWhenPathEmpty) {
  std::string name = deriveFilename("https://example.com/", {});
  EXPECT_EQ(name.rfind("download_", 0), 0u);
  EXPECT_EQ(name.size(), std::string("download_YYYYmmdd_HHMMSS").size());
}

TEST(FormatSizeTest, HumanReadableUnits) {
  EXPECT_EQ(formatSize(0), "Unknown");
  EXPECT_EQ(formatSize(512), "512.0 B");
  EXPECT_EQ(formatSize(1536), "1.5 KB");
  EXPECT_EQ(formatSize(3ull * 1024 * 1024 * 1024), "3.0 GB");
}
