#include "store/navigator.hpp"
#include "store/metadata_store.hpp"
#include <boost/log/trivial.hpp>

namespace bucketd {
namespace store {

Navigator::Navigator(Transaction& tx) : tx_(tx) {}


//==============================================
// LOOKUP
//==============================================

std::optional<Bucket> Navigator::resolve_container(const std::vector<std::string>& segments) {
  Bucket current = root_container();

  for (std::size_t i = 1; i < segments.size(); ++i) {
    auto next = current.bucket(segments[i]);
    if (!next) {
      return std::nullopt;
    }
    current = *next;
  }
  return current;
}

std::optional<ResolvedNode> Navigator::resolve_container_or_value(const Bucket& container,
                                                                  const std::string& last) {
  if (auto nested = container.bucket(last)) {
    return ResolvedNode{Container{*nested}};
  }
  if (ValuePtr bytes = container.get(last)) {
    return ResolvedNode{Value{bytes}};
  }
  return std::nullopt;
}

std::optional<ResolvedNode> Navigator::resolve(const std::vector<std::string>& segments) {
  if (segments.size() <= 1) {
    return ResolvedNode{Container{root_container()}};
  }

  std::vector<std::string> parent(segments.begin(), segments.end() - 1);
  auto container = resolve_container(parent);
  if (!container) {
    return std::nullopt;
  }
  return resolve_container_or_value(*container, segments.back());
}


//==============================================
// CREATION
//==============================================

Bucket Navigator::get_or_create_container_chain(const std::vector<std::string>& segments) {
  Bucket current = root_container();

  for (std::size_t i = 1; i < segments.size(); ++i) {
    current = current.create_bucket_if_not_exists(segments[i]);
  }
  return current;
}

Bucket Navigator::root_container() {
  auto root = tx_.bucket(MetadataStore::ROOT_BUCKET_NAME);
  if (!root) {
    BOOST_LOG_TRIVIAL(error) << "Navigator: Root container is missing";
    throw BucketNotFound(MetadataStore::ROOT_BUCKET_NAME);
  }
  return *root;
}

} // namespace store
} // namespace bucketd
