#include <gtest/gtest.h>
#include "protocol/conditional.hpp"

using namespace bucketd::protocol;

namespace {

EntityTags tags(std::vector<std::string> values) {
  return EntityTags(std::move(values));
}

} // namespace

TEST(ConditionalTest, ParsesEveryHeaderOccurrence) {
  std::vector<std::string> expected{"a", "b", "c", "*"};
  EXPECT_EQ(parse_entity_tags({"a, b", " c ,*"}), expected);
  EXPECT_TRUE(parse_entity_tags({""}).empty());
  EXPECT_EQ(parse_entity_tags({"a,,b"}), (std::vector<std::string>{"a", "b"}));
}

TEST(ConditionalTest, IfNoneMatchAbsentNeverHits) {
  EXPECT_FALSE(if_none_match_hits(std::nullopt, "etag"));
}

TEST(ConditionalTest, IfNoneMatchHitsOnWildcardOrStoredTag) {
  EXPECT_TRUE(if_none_match_hits(tags({"*"}), "etag"));
  EXPECT_TRUE(if_none_match_hits(tags({"other", "etag"}), "etag"));
  EXPECT_FALSE(if_none_match_hits(tags({"other"}), "etag"));
  EXPECT_FALSE(if_none_match_hits(tags({}), "etag"));
}

TEST(ConditionalTest, IfMatchAbsentAlwaysHolds) {
  EXPECT_TRUE(if_match_holds(std::nullopt, std::nullopt));
  EXPECT_TRUE(if_match_holds(std::nullopt, std::string("etag")));
}

TEST(ConditionalTest, IfMatchWithoutStoredRecord) {
  // "*" requires an existing resource
  EXPECT_FALSE(if_match_holds(tags({"*"}), std::nullopt));
  EXPECT_FALSE(if_match_holds(tags({"foo", "*"}), std::nullopt));
  EXPECT_TRUE(if_match_holds(tags({"foo"}), std::nullopt));
}

TEST(ConditionalTest, IfMatchWithStoredRecord) {
  const std::optional<std::string> stored("etag");
  EXPECT_TRUE(if_match_holds(tags({"*"}), stored));
  EXPECT_TRUE(if_match_holds(tags({"nope", "etag"}), stored));
  EXPECT_FALSE(if_match_holds(tags({"nope"}), stored));
  EXPECT_FALSE(if_match_holds(tags({}), stored));
}
