#include <gtest/gtest.h>
#include "protocol/listing_template.hpp"
#include "protocol/negotiator.hpp"

using namespace bucketd::protocol;

namespace {

const std::vector<std::string> NAMES = {"bar", "baz", "foo"};

} // namespace

TEST(NegotiatorTest, PicksFormatByPrefix) {
  EXPECT_EQ(negotiate_listing_format(""), ListingFormat::PlainText);
  EXPECT_EQ(negotiate_listing_format("*/*"), ListingFormat::PlainText);
  EXPECT_EQ(negotiate_listing_format("text/*"), ListingFormat::PlainText);
  EXPECT_EQ(negotiate_listing_format("text/plain; q=0.9"), ListingFormat::PlainText);
  EXPECT_EQ(negotiate_listing_format("application/json"), ListingFormat::Json);
  EXPECT_EQ(negotiate_listing_format("application/json, text/plain"), ListingFormat::Json);
  EXPECT_EQ(negotiate_listing_format("application/xml"), ListingFormat::Xml);
  EXPECT_EQ(negotiate_listing_format("text/html,application/xhtml+xml"), ListingFormat::Html);
}

TEST(NegotiatorTest, UnknownAcceptFallsBackToText) {
  EXPECT_EQ(negotiate_listing_format("image/png"), ListingFormat::PlainText);
  EXPECT_EQ(negotiate_listing_format("application/octet-stream"), ListingFormat::PlainText);
}

TEST(NegotiatorTest, PlainTextListsOneNamePerLine) {
  Listing listing = render_listing(ListingFormat::PlainText, "/", NAMES);
  EXPECT_EQ(listing.content_type, "text/plain; charset=utf-8");
  EXPECT_EQ(listing.body, "bar\nbaz\nfoo\n");

  EXPECT_EQ(render_listing(ListingFormat::PlainText, "/", {}).body, "");
}

TEST(NegotiatorTest, JsonIsAnArrayOfNames) {
  Listing listing = render_listing(ListingFormat::Json, "/", NAMES);
  EXPECT_EQ(listing.content_type, "application/json; charset=utf-8");
  EXPECT_EQ(listing.body, "[\"bar\",\"baz\",\"foo\"]\n");

  EXPECT_EQ(render_listing(ListingFormat::Json, "/", {}).body, "[]\n");
  EXPECT_EQ(render_listing(ListingFormat::Json, "/", {"a\"b\\c"}).body, "[\"a\\\"b\\\\c\"]\n");
}

TEST(NegotiatorTest, JsonEscapesControlBytesAndReplacesInvalidUtf8) {
  EXPECT_EQ(render_listing(ListingFormat::Json, "/", {"tab\there"}).body, "[\"tab\\there\"]\n");
  EXPECT_EQ(render_listing(ListingFormat::Json, "/", {std::string("nul\0", 4)}).body, "[\"nul\\u0000\"]\n");
  EXPECT_EQ(render_listing(ListingFormat::Json, "/", {"caf\xc3\xa9"}).body, "[\"caf\xc3\xa9\"]\n");
  EXPECT_EQ(render_listing(ListingFormat::Json, "/", {"bad\xff"}).body, "[\"bad\xef\xbf\xbd\"]\n");
}

TEST(NegotiatorTest, XmlHasBucketRootAndKeyChildren) {
  Listing listing = render_listing(ListingFormat::Xml, "/", NAMES);
  EXPECT_EQ(listing.content_type, "application/xml; charset=utf-8");
  EXPECT_EQ(listing.body.rfind("<?xml", 0), 0u);

  std::size_t bucket = listing.body.find("<bucket>");
  std::size_t bar = listing.body.find("<key>bar</key>");
  std::size_t baz = listing.body.find("<key>baz</key>");
  std::size_t foo = listing.body.find("<key>foo</key>");
  ASSERT_NE(bucket, std::string::npos);
  ASSERT_NE(bar, std::string::npos);
  ASSERT_NE(baz, std::string::npos);
  ASSERT_NE(foo, std::string::npos);
  EXPECT_LT(bucket, bar);
  EXPECT_LT(bar, baz);
  EXPECT_LT(baz, foo);
  EXPECT_NE(listing.body.find("</bucket>"), std::string::npos);
}

TEST(NegotiatorTest, HtmlLinksEntriesBelowBasePath) {
  Listing listing = render_listing(ListingFormat::Html, "/foo", NAMES);
  EXPECT_EQ(listing.content_type, "text/html; charset=utf-8");
  EXPECT_NE(listing.body.find("<title>/foo</title>"), std::string::npos);
  EXPECT_NE(listing.body.find("<a href=\"/foo/bar\">bar</a>"), std::string::npos);
  EXPECT_NE(listing.body.find("<a href=\"/foo/foo\">foo</a>"), std::string::npos);
  EXPECT_EQ(listing.body.find("Empty bucket."), std::string::npos);
}

TEST(NegotiatorTest, HtmlShowsEmptyBucket) {
  Listing listing = render_listing(ListingFormat::Html, "/", {});
  EXPECT_NE(listing.body.find("Empty bucket."), std::string::npos);
  EXPECT_EQ(listing.body.find("<ul>"), std::string::npos);
}

TEST(ListingTemplateTest, EscapesMarkup) {
  EXPECT_EQ(html_escape("<a href=\"x\">&'</a>"), "&lt;a href=&#34;x&#34;&gt;&amp;&#39;&lt;/a&gt;");

  std::string page = render_listing_page("/", {"<script>"});
  EXPECT_EQ(page.find("<script>"), std::string::npos);
  EXPECT_NE(page.find("&lt;script&gt;"), std::string::npos);
}

TEST(ListingTemplateTest, JoinPathUsesOneSlash) {
  EXPECT_EQ(join_path("/", "foo"), "/foo");
  EXPECT_EQ(join_path("/a/", "b"), "/a/b");
  EXPECT_EQ(join_path("/a", "b"), "/a/b");
}
