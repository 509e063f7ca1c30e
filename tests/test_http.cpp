// test_http.cpp: header parsing, URL checks and error text

#include <gtest/gtest.h>

#include "transferkit/error.hpp"
#include "transferkit/http.hpp"
#include "transferkit/url.hpp"

using namespace transferkit;

// ═══════════════════════════════════════════════════════════
// Headers
// ═══════════════════════════════════════════════════════════

TEST(HeaderParsingTest, NamesAreLowerCasedAndValuesTrimmed) {
    Headers headers;
    parseHeaderLine("Content-Type:  application/json \r\n", headers);
    parseHeaderLine("ETag: \"v1\"\r\n", headers);
    parseHeaderLine("\r\n", headers);
    parseHeaderLine("garbage without colon\r\n", headers);

    ASSERT_EQ(headers.size(), 2u);
    EXPECT_EQ(headers.at("content-type"), "application/json");
    EXPECT_EQ(headers.at("etag"), "\"v1\"");
}

TEST(HeaderParsingTest, StatusLineStartsOver) {
    Headers headers;
    parseHeaderLine("HTTP/1.1 301 Moved Permanently\r\n", headers);
    parseHeaderLine("Location: https://example.com/new\r\n", headers);
    parseHeaderLine("HTTP/2 200\r\n", headers);
    parseHeaderLine("Content-Length: 12\r\n", headers);

    EXPECT_FALSE(findHeader(headers, "location").has_value());
    EXPECT_EQ(findHeader(headers, "Content-Length").value_or(""), "12");
}

TEST(HeaderParsingTest, ValueMayContainColons) {
    Headers headers;
    parseHeaderLine("Last-Modified: Wed, 21 Oct 2015 07:28:00 GMT\r\n", headers);
    EXPECT_EQ(findHeader(headers, "LAST-MODIFIED").value_or(""), "Wed, 21 Oct 2015 07:28:00 GMT");
}

TEST(DispositionTest, QuotedAndBareFilenames) {
    EXPECT_EQ(dispositionFilename("attachment; filename=\"a b.txt\"").value_or(""), "a b.txt");
    EXPECT_EQ(dispositionFilename("attachment; filename=plain.csv; size=10").value_or(""), "plain.csv");
    EXPECT_EQ(dispositionFilename("attachment; FILENAME = loud.txt").value_or(""), "loud.txt");
}

TEST(DispositionTest, EncodedOnlyOrMissingGivesNothing) {
    EXPECT_FALSE(dispositionFilename("inline").has_value());
    EXPECT_FALSE(dispositionFilename("attachment; filename*=UTF-8''na%C3%AFve.txt").has_value());
    EXPECT_FALSE(dispositionFilename("attachment; filename=\"\"").has_value());
    EXPECT_EQ(dispositionFilename("attachment; filename*=UTF-8''x.txt; filename=\"fallback.txt\"").value_or(""),
              "fallback.txt");
}

TEST(StatusTest, OnlyTwoHundredsSucceed) {
    EXPECT_TRUE(isSuccessStatus(200));
    EXPECT_TRUE(isSuccessStatus(206));
    EXPECT_FALSE(isSuccessStatus(199));
    EXPECT_FALSE(isSuccessStatus(304));
    EXPECT_FALSE(isSuccessStatus(404));
    EXPECT_FALSE(isSuccessStatus(0));
}

// ═══════════════════════════════════════════════════════════
// URLs
// ═══════════════════════════════════════════════════════════

TEST(UrlTest, AcceptsWellFormedUrls) {
    const auto parsed = parseUrl("HTTPS://user@Example.com:8443/a/b.txt?x=1#frag");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->scheme, "https");
    EXPECT_EQ(parsed->host, "Example.com");
    EXPECT_EQ(parsed->path, "/a/b.txt");

    EXPECT_TRUE(parseUrl("http://[::1]:8080/").has_value());
    EXPECT_TRUE(parseUrl("file:///tmp/data.bin").has_value());
}

TEST(UrlTest, RejectsMalformedUrls) {
    EXPECT_FALSE(parseUrl("").has_value());
    EXPECT_FALSE(parseUrl("example.com/path").has_value());
    EXPECT_FALSE(parseUrl("://example.com").has_value());
    EXPECT_FALSE(parseUrl("http://").has_value());
    EXPECT_FALSE(parseUrl("http://exa mple.com/").has_value());
    EXPECT_FALSE(parseUrl("1http://example.com").has_value());
    EXPECT_FALSE(parseUrl("http://[::1/").has_value());
    EXPECT_FALSE(parseUrl("http://:80/").has_value());
}

TEST(UrlTest, LastPathSegment) {
    EXPECT_EQ(lastPathSegment("https://example.com/files/report.pdf"), "report.pdf");
    EXPECT_EQ(lastPathSegment("https://example.com/files/?page=2"), "files");
    EXPECT_EQ(lastPathSegment("https://example.com"), "");
    EXPECT_EQ(lastPathSegment("not a url"), "");
}

// ═══════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════

TEST(ErrorTest, MessageCarriesKindStatusAndCause) {
    EXPECT_EQ(badServerResponse(503).message(), "BadServerResponse (HTTP 503)");
    EXPECT_EQ(makeError(ErrorKind::TransportFailure, "timed out").message(), "TransportFailure: timed out");
    EXPECT_EQ(makeError(ErrorKind::Cancelled).message(), "Cancelled");
    EXPECT_EQ(toString(ErrorKind::BadUrl), "BadURL");
}

TEST(ErrorTest, ExceptionExposesError) {
    const TransferException ex(makeError(ErrorKind::InvalidResumeToken, "already used"));
    EXPECT_STREQ(ex.what(), "InvalidResumeToken: already used");
    EXPECT_EQ(ex.kind(), ErrorKind::InvalidResumeToken);
    EXPECT_EQ(ex.error().cause, "already used");
}
