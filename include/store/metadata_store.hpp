#ifndef BUCKETD_STORE_METADATA_STORE_HPP
#define BUCKETD_STORE_METADATA_STORE_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "store/store.hpp"

namespace bucketd {
namespace store {

// HTTP header state kept beside every stored value
struct MetadataRecord {
  std::optional<std::string> content_type;
  std::optional<std::string> content_length;
  std::string etag;
  std::string last_modified;

  // Header name/value pairs for the fields that are set, in a fixed order
  std::vector<std::pair<std::string, std::string>> headers() const;

  // Keeps only Content-Type and Content-Length of a request. ETag and Last-Modified are stamped by the server
  static MetadataRecord extract(const std::vector<std::pair<std::string, std::string>>& request_headers);

  // JSON object keyed by HTTP header name
  std::string serialize() const;
  // Throws StoreError if the bytes are not a JSON object
  static MetadataRecord parse(const std::string& serialized);

  bool operator==(const MetadataRecord& other) const;
};

class MetadataStore {
public:
  // Top level bucket holding the records. The leading NUL keeps it out of reach of URLs
  static const std::string BUCKET_NAME;
  // Top level bucket holding the namespace tree
  static const std::string ROOT_BUCKET_NAME;
  static const std::string ROOT_PATH;

  // ---- CONSTRUCTOR ----
  explicit MetadataStore(Transaction& tx);


  // ---- STARTUP ----
  // Creates the metadata bucket with the root record and the root container.
  // Idempotent; any failure is fatal for the process
  static void bootstrap(Database& database);


  // ---- RECORD OPERATIONS ----
  // Absent if nothing was ever written at path. Throws StoreError if the metadata bucket is missing
  std::optional<MetadataRecord> get(const std::string& path);
  void put(const std::string& path, const MetadataRecord& record);
  void remove(const std::string& path);

private:
  Bucket metadata_bucket();

  Transaction& tx_;
};

} // namespace store
} // namespace bucketd

#endif // BUCKETD_STORE_METADATA_STORE_HPP
