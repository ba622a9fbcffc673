#include <gtest/gtest.h>
#include "protocol/path_resolver.hpp"

using namespace bucketd::protocol;

TEST(PathResolverTest, RootPathIsOnlyTheRootSegment) {
  EXPECT_EQ(split_path("/"), Segments{"/"});
  EXPECT_EQ(split_path(""), Segments{"/"});
  EXPECT_EQ(split_path("///"), Segments{"/"});
}

TEST(PathResolverTest, SplitsOnSlashAndDropsEmptyComponents) {
  Segments expected{"/", "foo", "bar"};
  EXPECT_EQ(split_path("/foo/bar"), expected);
  EXPECT_EQ(split_path("/foo/bar/"), expected);
  EXPECT_EQ(split_path("//foo//bar"), expected);
  EXPECT_EQ(split_path("foo/bar"), expected);
}

TEST(PathResolverTest, EscapesAreNotDecoded) {
  Segments expected{"/", "foo", "bar%2fbaz"};
  EXPECT_EQ(split_path("/foo/bar%2fbaz"), expected);
  EXPECT_EQ(split_path("/a%20b"), (Segments{"/", "a%20b"}));
}

TEST(PathResolverTest, RequestPathDropsQueryAndFragment) {
  EXPECT_EQ(request_path("/foo/bar?x=1"), "/foo/bar");
  EXPECT_EQ(request_path("/foo#frag"), "/foo");
  EXPECT_EQ(request_path("/foo/bar"), "/foo/bar");
  EXPECT_EQ(request_path("/?"), "/");
}

TEST(PathResolverTest, CanonicalPathJoinsSegments) {
  EXPECT_EQ(canonical_path(split_path("/")), "/");
  EXPECT_EQ(canonical_path(split_path("/a//b/")), "/a/b");
  EXPECT_EQ(canonical_path(split_path("/a/b")), "/a/b");
  EXPECT_EQ(canonical_path(split_path("/a%2fb")), "/a%2fb");
}

TEST(PathResolverTest, DepthCountsSegmentsBelowRoot) {
  EXPECT_EQ(depth(split_path("/")), 0u);
  EXPECT_EQ(depth(split_path("/foo")), 1u);
  EXPECT_EQ(depth(split_path("/foo/bar/baz")), 3u);
}
