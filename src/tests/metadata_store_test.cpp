#include <gtest/gtest.h>
#include "store/metadata_store.hpp"
#include "test_utils.hpp"

using namespace bucketd::store;

class MetadataStoreTest : public ::testing::Test {
protected:
  std::unique_ptr<Database> database;

  void SetUp() override {
    init_test_logging();
    database = std::make_unique<Database>();
    MetadataStore::bootstrap(*database);
  }

  static MetadataRecord make_record(const std::string& etag) {
    MetadataRecord record;
    record.content_type = "text/plain";
    record.content_length = "5";
    record.etag = etag;
    record.last_modified = "Mon, 02 Jan 2006 15:04:05 +0000";
    return record;
  }
};

TEST_F(MetadataStoreTest, BootstrapCreatesBucketsAndRootRecord) {
  auto tx = database->begin(false);
  EXPECT_TRUE(tx->bucket(MetadataStore::BUCKET_NAME).has_value());
  EXPECT_TRUE(tx->bucket(MetadataStore::ROOT_BUCKET_NAME).has_value());
  EXPECT_EQ(*tx->bucket(MetadataStore::BUCKET_NAME)->get("/"), "{}");

  MetadataStore metadata(*tx);
  auto root = metadata.get(MetadataStore::ROOT_PATH);
  ASSERT_TRUE(root.has_value());
  EXPECT_TRUE(root->headers().empty());
}

TEST_F(MetadataStoreTest, BootstrapIsIdempotent) {
  {
    auto tx = database->begin(true);
    MetadataStore metadata(*tx);
    metadata.put("/a/b", make_record("tag"));
    tx->create_bucket_if_not_exists(MetadataStore::ROOT_BUCKET_NAME).create_bucket_if_not_exists("a");
    tx->commit();
  }

  MetadataStore::bootstrap(*database);

  auto tx = database->begin(false);
  EXPECT_TRUE(MetadataStore(*tx).get("/a/b").has_value());
  EXPECT_TRUE(tx->bucket(MetadataStore::ROOT_BUCKET_NAME)->bucket("a").has_value());
}

TEST_F(MetadataStoreTest, MetadataBucketIsNotAddressable) {
  EXPECT_EQ(MetadataStore::BUCKET_NAME.size(), 8u);
  EXPECT_EQ(MetadataStore::BUCKET_NAME[0], '\0');
  EXPECT_EQ(MetadataStore::BUCKET_NAME.substr(1), "headers");
}

TEST_F(MetadataStoreTest, PutGetRemove) {
  auto tx = database->begin(true);
  MetadataStore metadata(*tx);

  EXPECT_FALSE(metadata.get("/a/b").has_value());

  metadata.put("/a/b", make_record("first"));
  auto record = metadata.get("/a/b");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(*record, make_record("first"));

  // Upsert
  metadata.put("/a/b", make_record("second"));
  EXPECT_EQ(metadata.get("/a/b")->etag, "second");

  metadata.remove("/a/b");
  EXPECT_FALSE(metadata.get("/a/b").has_value());
  EXPECT_NO_THROW(metadata.remove("/a/b"));
}

TEST_F(MetadataStoreTest, MissingMetadataBucketIsAStorageError) {
  Database bare;
  auto tx = bare.begin(false);
  MetadataStore metadata(*tx);
  EXPECT_THROW(metadata.get("/a/b"), StoreError);
}

TEST_F(MetadataStoreTest, RecordSerializesHeaderNames) {
  MetadataRecord record = make_record("abc=");
  std::string serialized = record.serialize();

  EXPECT_NE(serialized.find("\"Content-Type\""), std::string::npos);
  EXPECT_NE(serialized.find("\"Content-Length\""), std::string::npos);
  EXPECT_NE(serialized.find("\"ETag\""), std::string::npos);
  EXPECT_NE(serialized.find("\"Last-Modified\""), std::string::npos);
  EXPECT_EQ(MetadataRecord::parse(serialized), record);
}

TEST_F(MetadataStoreTest, RecordHeadersSkipUnsetFields) {
  MetadataRecord record;
  record.etag = "tag";
  record.last_modified = "Mon, 02 Jan 2006 15:04:05 +0000";

  auto headers = record.headers();
  ASSERT_EQ(headers.size(), 2u);
  EXPECT_EQ(headers[0].first, "ETag");
  EXPECT_EQ(headers[1].first, "Last-Modified");
}

TEST_F(MetadataStoreTest, CorruptRecordIsAStorageError) {
  EXPECT_THROW(MetadataRecord::parse("not json"), StoreError);
  EXPECT_THROW(MetadataRecord::parse("[\"ETag\", \"tag\"]"), StoreError);
  EXPECT_THROW(MetadataRecord::parse(R"({"ETag": 5})"), StoreError);
  EXPECT_EQ(MetadataRecord::parse("{}"), MetadataRecord{});
}

TEST_F(MetadataStoreTest, ExtractKeepsOnlyContentHeaders) {
  MetadataRecord record = MetadataRecord::extract({
    {"content-type", "application/json"},
    {"Content-Length", "12"},
    {"ETag", "client supplied"},
    {"Last-Modified", "yesterday"},
    {"X-Custom", "ignored"}
  });

  EXPECT_EQ(record.content_type, std::optional<std::string>("application/json"));
  EXPECT_EQ(record.content_length, std::optional<std::string>("12"));
  EXPECT_TRUE(record.etag.empty());
  EXPECT_TRUE(record.last_modified.empty());
}
