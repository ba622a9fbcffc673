#include "store/metadata_store.hpp"
#include <boost/beast/core/string.hpp>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>

namespace bucketd {
namespace store {

using json = nlohmann::json;

namespace {

const char* const CONTENT_TYPE = "Content-Type";
const char* const CONTENT_LENGTH = "Content-Length";
const char* const ETAG = "ETag";
const char* const LAST_MODIFIED = "Last-Modified";

} // namespace

const std::string MetadataStore::BUCKET_NAME = std::string(1, '\0') + "headers";
const std::string MetadataStore::ROOT_BUCKET_NAME = "/";
const std::string MetadataStore::ROOT_PATH = "/";


//==============================================
// METADATA RECORD
//==============================================

std::vector<std::pair<std::string, std::string>> MetadataRecord::headers() const {
  std::vector<std::pair<std::string, std::string>> result;
  if (content_type) {
    result.emplace_back(CONTENT_TYPE, *content_type);
  }
  if (content_length) {
    result.emplace_back(CONTENT_LENGTH, *content_length);
  }
  if (!etag.empty()) {
    result.emplace_back(ETAG, etag);
  }
  if (!last_modified.empty()) {
    result.emplace_back(LAST_MODIFIED, last_modified);
  }
  return result;
}

MetadataRecord MetadataRecord::extract(const std::vector<std::pair<std::string, std::string>>& request_headers) {
  MetadataRecord record;
  for (const auto& [name, value] : request_headers) {
    if (boost::beast::iequals(name, CONTENT_TYPE)) {
      record.content_type = value;
    } else if (boost::beast::iequals(name, CONTENT_LENGTH)) {
      record.content_length = value;
    }
  }
  return record;
}

std::string MetadataRecord::serialize() const {
  json object = json::object();
  for (const auto& [name, value] : headers()) {
    object[name] = value;
  }
  return object.dump();
}

MetadataRecord MetadataRecord::parse(const std::string& serialized) {
  try {
    json object = json::parse(serialized);
    if (!object.is_object()) {
      throw StoreError("Store: Corrupt metadata record: not a JSON object");
    }

    MetadataRecord record;
    if (object.contains(CONTENT_TYPE)) {
      record.content_type = object[CONTENT_TYPE].get<std::string>();
    }
    if (object.contains(CONTENT_LENGTH)) {
      record.content_length = object[CONTENT_LENGTH].get<std::string>();
    }
    record.etag = object.value(ETAG, "");
    record.last_modified = object.value(LAST_MODIFIED, "");
    return record;
  } catch (const json::exception& e) {
    throw StoreError("Store: Corrupt metadata record: " + std::string(e.what()));
  }
}

bool MetadataRecord::operator==(const MetadataRecord& other) const {
  return content_type == other.content_type
      && content_length == other.content_length
      && etag == other.etag
      && last_modified == other.last_modified;
}


//==============================================
// CONSTRUCTOR AND STARTUP
//==============================================

MetadataStore::MetadataStore(Transaction& tx) : tx_(tx) {}

void MetadataStore::bootstrap(Database& database) {
  BOOST_LOG_TRIVIAL(info) << "Metadata store: Bootstrapping metadata and root buckets";

  auto tx = database.begin(true);
  Bucket metadata = tx->create_bucket_if_not_exists(BUCKET_NAME);
  if (!metadata.get(ROOT_PATH)) {
    metadata.put(ROOT_PATH, "{}");
  }
  tx->create_bucket_if_not_exists(ROOT_BUCKET_NAME);
  tx->commit();

  BOOST_LOG_TRIVIAL(debug) << "Metadata store: Bootstrap complete";
}


//==============================================
// RECORD OPERATIONS
//==============================================

std::optional<MetadataRecord> MetadataStore::get(const std::string& path) {
  ValuePtr serialized = metadata_bucket().get(path);
  if (!serialized) {
    return std::nullopt;
  }
  return MetadataRecord::parse(*serialized);
}

void MetadataStore::put(const std::string& path, const MetadataRecord& record) {
  BOOST_LOG_TRIVIAL(debug) << "Metadata store: Writing record for " << path;
  metadata_bucket().put(path, record.serialize());
}

void MetadataStore::remove(const std::string& path) {
  BOOST_LOG_TRIVIAL(debug) << "Metadata store: Removing record for " << path;
  metadata_bucket().remove(path);
}

Bucket MetadataStore::metadata_bucket() {
  auto bucket = tx_.bucket(BUCKET_NAME);
  if (!bucket) {
    BOOST_LOG_TRIVIAL(error) << "Metadata store: Metadata bucket is missing";
    throw BucketNotFound("metadata");
  }
  return *bucket;
}

} // namespace store
} // namespace bucketd
