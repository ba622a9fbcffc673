#ifndef BUCKETD_STORE_NAVIGATOR_HPP
#define BUCKETD_STORE_NAVIGATOR_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "store/store.hpp"

namespace bucketd {
namespace store {

// A path segment that names a nested bucket
struct Container {
  Bucket bucket;
};

// A path segment that names stored bytes
struct Value {
  ValuePtr bytes;
};

using ResolvedNode = std::variant<Container, Value>;

// Walks URL segments through the namespace tree of one transaction.
// segments[0] is always the root segment and names the root container
class Navigator {
public:
  explicit Navigator(Transaction& tx);

  // ---- LOOKUP ----
  // Container named by all segments, or nothing as soon as one of them is not a container.
  // Throws StoreError if the root container is missing
  std::optional<Bucket> resolve_container(const std::vector<std::string>& segments);
  // What last names inside container, or nothing if it names neither
  std::optional<ResolvedNode> resolve_container_or_value(const Bucket& container, const std::string& last);
  // Node named by the full segment list. Depth 0 is the root container
  std::optional<ResolvedNode> resolve(const std::vector<std::string>& segments);


  // ---- CREATION ----
  // Creates each missing container along segments and returns the last one.
  // Throws IncompatibleValue if a segment already names a value
  Bucket get_or_create_container_chain(const std::vector<std::string>& segments);

private:
  Bucket root_container();

  Transaction& tx_;
};

} // namespace store
} // namespace bucketd

#endif // BUCKETD_STORE_NAVIGATOR_HPP
