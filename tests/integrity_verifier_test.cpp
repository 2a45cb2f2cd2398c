#include <gtest/gtest.h>

#include "DownloadError.hpp"
#include "IntegrityVerifier.hpp"
#include "test_helpers.hpp"

using namespace parfetch;

TEST(IntegrityVerifierTest, KnownDigests) {
  TempDir dir;
  writeFile(dir.file("abc"), "abc");
  writeFile(dir.file("empty"), "");
  EXPECT_EQ(IntegrityVerifier::sha256File(dir.file("abc")),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(IntegrityVerifier::sha256File(dir.file("empty")),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(IntegrityVerifierTest, SkipsWhenDisabledOrOverThreshold) {
  TempDir dir;
  writeFile(dir.file("data"), std::string(2000, 'a'));

  EXPECT_FALSE(IntegrityVerifier(false, 0).digest(dir.file("data")).has_value());
  EXPECT_FALSE(IntegrityVerifier(true, 1000).digest(dir.file("data")).has_value());
  EXPECT_TRUE(IntegrityVerifier(true, 2000).digest(dir.file("data")).has_value());
  // 0 表示不设上限
  EXPECT_TRUE(IntegrityVerifier(true, 0).digest(dir.file("data")).has_value());
}

TEST(IntegrityVerifierTest, MissingFileIsDiskError) {
  TempDir dir;
  try {
    IntegrityVerifier::sha256File(dir.file("nope"));
    FAIL() << "sha256File should throw";
  } catch (const DownloadError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::DISK);
  }
}

TEST(IntegrityVerifierTest, MatchIgnoresCaseAndWhitespace) {
  const std::string digest =
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
  EXPECT_TRUE(IntegrityVerifier::matches(
      digest, "  BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD\n"));
  EXPECT_FALSE(IntegrityVerifier::matches(digest, digest.substr(1)));
  EXPECT_FALSE(IntegrityVerifier::matches(digest, ""));
}
