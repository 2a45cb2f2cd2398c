#include <gtest/gtest.h>

#include <string>

#include "UrlValidator.hpp"

using namespace parfetch;

namespace {

UrlPolicy defaultPolicy() { return UrlPolicy::fromConfig(DownloadConfig()); }

}  // namespace

TEST(UrlValidatorTest, RejectsSchemeOutsideAllowList) {
  UrlPolicy policy = defaultPolicy();
  policy.allowedSchemes = {"http", "https"};
  auto result = validateUrl("ftp://internal", policy);
  EXPECT_EQ(result.status, ValidationStatus::DISALLOWED_SCHEME);
  EXPECT_NE(result.reason.find("ftp"), std::string::npos);
}

TEST(UrlValidatorTest, RejectsBlockedExtension) {
  auto result = validateUrl("https://example.com/file.exe", defaultPolicy());
  EXPECT_EQ(result.status, ValidationStatus::BLOCKED_EXTENSION);
}

TEST(UrlValidatorTest, AcceptsOrdinaryArchiveWithoutBlocks) {
  UrlPolicy policy;
  policy.allowedSchemes = {"https"};
  EXPECT_TRUE(validateUrl("https://example.com/file.zip", policy).ok());
  EXPECT_TRUE(validateUrl("https://example.com/file.zip", defaultPolicy()).ok());
}

TEST(UrlValidatorTest, ExtensionMatchIgnoresCaseQueryAndEncoding) {
  UrlPolicy policy = defaultPolicy();
  EXPECT_EQ(validateUrl("https://example.com/SETUP.EXE", policy).status,
            ValidationStatus::BLOCKED_EXTENSION);
  EXPECT_EQ(validateUrl("https://example.com/setup%2Eexe?x=1", policy).status,
            ValidationStatus::BLOCKED_EXTENSION);
  EXPECT_TRUE(validateUrl("https://example.com/setup.zip?name=a.exe", policy).ok());
}

TEST(UrlValidatorTest, MalformedIsDistinctFromPolicyRejection) {
  UrlPolicy policy = defaultPolicy();
  EXPECT_EQ(validateUrl("", policy).status, ValidationStatus::MALFORMED);
  EXPECT_EQ(validateUrl("not a url", policy).status, ValidationStatus::MALFORMED);
  EXPECT_EQ(validateUrl("example.com/file.zip", policy).status,
            ValidationStatus::MALFORMED);
  EXPECT_EQ(validateUrl("1http://example.com/", policy).status,
            ValidationStatus::MALFORMED);
  EXPECT_EQ(validateUrl("http://example.com:99999/", policy).status,
            ValidationStatus::MALFORMED);
  EXPECT_EQ(validateUrl("http://[::1/", policy).status,
            ValidationStatus::MALFORMED);
  EXPECT_EQ(validateUrl("http://exa mple.com/a.zip", policy).status,
            ValidationStatus::MALFORMED);
  EXPECT_NE(validateUrl("http://example.com:99999/", policy).reason.find(
                "Malformed"),
            std::string::npos);
}

TEST(UrlValidatorTest, UndecodableEscapeIsNotAPolicyMatch) {
  EXPECT_TRUE(validateUrl("http://example.com/bad%zzescape",
                          defaultPolicy()).ok());
  EXPECT_EQ(validateUrl("http://example.com/a%zz.exe", defaultPolicy()).status,
            ValidationStatus::BLOCKED_EXTENSION);
}

TEST(UrlValidatorTest, RejectsMissingHost) {
  UrlPolicy policy = defaultPolicy();
  policy.allowedSchemes.push_back("file");
  EXPECT_EQ(validateUrl("file:///tmp/a.zip", policy).status,
            ValidationStatus::MISSING_HOST);
  EXPECT_FALSE(validateUrl("http://:8080/a.zip", policy).ok());
}

TEST(UrlValidatorTest, RejectsBlockedHostRegardlessOfPortAndCase) {
  UrlPolicy policy = defaultPolicy();
  EXPECT_EQ(validateUrl("http://LOCALHOST:8080/a.zip", policy).status,
            ValidationStatus::BLOCKED_HOST);
  EXPECT_EQ(validateUrl("http://user:pw@127.0.0.1/a.zip", policy).status,
            ValidationStatus::BLOCKED_HOST);
  EXPECT_TRUE(validateUrl("http://example.com:8080/a.zip", policy).ok());
}

TEST(UrlValidatorTest, ParseUrlSplitsComponents) {
  ParsedUrl parsed;
  ASSERT_TRUE(parseUrl("HTTPS://User@Example.COM:8443/dir/a%20b.iso?q=1#frag",
                       &parsed));
  EXPECT_EQ(parsed.scheme, "https");
  EXPECT_EQ(parsed.host, "example.com");
  EXPECT_EQ(parsed.port, "8443");
  EXPECT_EQ(parsed.path, "/dir/a%20b.iso");

  ASSERT_TRUE(parseUrl("http://[2001:db8::1]:80/x", &parsed));
  EXPECT_EQ(parsed.host, "2001:db8::1");
  EXPECT_EQ(parsed.port, "80");
}

TEST(UrlValidatorTest, ParseUrlAcceptsSchemesOutsideLibcurl) {
  ParsedUrl parsed;
  ASSERT_TRUE(parseUrl("gopherx://mirror.example.org/pub/a.iso", &parsed));
  EXPECT_EQ(parsed.scheme, "gopherx");
  EXPECT_EQ(parsed.host, "mirror.example.org");
  EXPECT_EQ(parsed.path, "/pub/a.iso");
  EXPECT_FALSE(parseUrl("no-scheme/a.iso", &parsed));
}

TEST(UrlValidatorTest, UrlDecode) {
  EXPECT_EQ(urlDecode("a%20b%2Fc"), "a b/c");
  EXPECT_EQ(urlDecode("plain"), "plain");
  EXPECT_EQ(urlDecode("bad%2"), "bad%2");
  EXPECT_EQ(urlDecode("bad%g0"), "bad%g0");
}
