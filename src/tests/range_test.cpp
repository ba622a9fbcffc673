#include <gtest/gtest.h>
#include "protocol/range.hpp"

using namespace bucketd::protocol;

namespace {

const std::string VALUE = "123456789";

} // namespace

TEST(RangeTest, ParsesBoundedSpan) {
  auto ranges = parse_range_header("bytes=2-4", VALUE.size());
  ASSERT_EQ(ranges.size(), 1u);
  EXPECT_EQ(ranges[0], (ByteRange{2, 4}));
  EXPECT_EQ(ranges[0].length(), 3u);
  EXPECT_EQ(slice_ranges(VALUE, ranges), "345");
}

TEST(RangeTest, OpenEndedSpanRunsToTheEnd) {
  auto ranges = parse_range_header("bytes=6-", VALUE.size());
  EXPECT_EQ(slice_ranges(VALUE, ranges), "789");
}

TEST(RangeTest, SuffixSpanIsClamped) {
  EXPECT_EQ(slice_ranges(VALUE, parse_range_header("bytes=-3", VALUE.size())), "789");
  EXPECT_EQ(slice_ranges(VALUE, parse_range_header("bytes=-100", VALUE.size())), VALUE);
}

TEST(RangeTest, MultipleSpansKeepHeaderOrder) {
  auto ranges = parse_range_header("bytes=0-0, 1-2, 0-0", VALUE.size());
  ASSERT_EQ(ranges.size(), 3u);
  EXPECT_EQ(slice_ranges(VALUE, ranges), "1231");
  EXPECT_EQ(slice_ranges(VALUE, parse_range_header("bytes=4-5,0-1", VALUE.size())), "5612");
}

TEST(RangeTest, MalformedHeaders) {
  EXPECT_THROW(parse_range_header("items=0-1", VALUE.size()), MalformedRange);
  EXPECT_THROW(parse_range_header("bytes=a-b", VALUE.size()), MalformedRange);
  EXPECT_THROW(parse_range_header("bytes=5", VALUE.size()), MalformedRange);
  EXPECT_THROW(parse_range_header("bytes=4-2", VALUE.size()), MalformedRange);
  EXPECT_THROW(parse_range_header("bytes=-", VALUE.size()), MalformedRange);
}

TEST(RangeTest, UnsatisfiableHeaders) {
  EXPECT_THROW(parse_range_header("bytes=2-1000", VALUE.size()), UnsatisfiableRange);
  EXPECT_THROW(parse_range_header("bytes=9-", VALUE.size()), UnsatisfiableRange);
  EXPECT_THROW(parse_range_header("bytes=-0", VALUE.size()), UnsatisfiableRange);
  EXPECT_THROW(parse_range_header("bytes=", VALUE.size()), UnsatisfiableRange);
  EXPECT_THROW(parse_range_header("bytes=0-0", 0), UnsatisfiableRange);
  EXPECT_THROW(parse_range_header("bytes=99999999999999999999999-", VALUE.size()), UnsatisfiableRange);
}

TEST(RangeTest, ErrorsShareABaseClass) {
  EXPECT_THROW(parse_range_header("items=0-1", VALUE.size()), RangeError);
  EXPECT_THROW(parse_range_header("bytes=100-", VALUE.size()), RangeError);
}

TEST(RangeTest, ContentRangeHeader) {
  EXPECT_EQ(content_range(ByteRange{2, 4}, 9), "bytes 2-4/9");
}
