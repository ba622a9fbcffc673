#include "protocol/conditional.hpp"
#include <algorithm>

namespace bucketd {
namespace protocol {

namespace {

const std::string ANY = "*";

std::string trim(const std::string& value) {
  const char* whitespace = " \t";
  std::size_t first = value.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return "";
  }
  std::size_t last = value.find_last_not_of(whitespace);
  return value.substr(first, last - first + 1);
}

bool lists(const std::vector<std::string>& tags, const std::string& tag) {
  return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

} // namespace

std::vector<std::string> parse_entity_tags(const std::vector<std::string>& header_values) {
  std::vector<std::string> tags;
  for (const auto& value : header_values) {
    std::size_t start = 0;
    while (start <= value.size()) {
      std::size_t end = value.find(',', start);
      if (end == std::string::npos) {
        end = value.size();
      }
      std::string tag = trim(value.substr(start, end - start));
      if (!tag.empty()) {
        tags.push_back(std::move(tag));
      }
      start = end + 1;
    }
  }
  return tags;
}

bool if_none_match_hits(const EntityTags& if_none_match, const std::string& stored_etag) {
  if (!if_none_match) {
    return false;
  }
  return lists(*if_none_match, ANY) || lists(*if_none_match, stored_etag);
}

bool if_match_holds(const EntityTags& if_match, const std::optional<std::string>& stored_etag) {
  if (!if_match) {
    return true;
  }
  if (!stored_etag) {
    return !lists(*if_match, ANY);
  }
  return lists(*if_match, ANY) || lists(*if_match, *stored_etag);
}

} // namespace protocol
} // namespace bucketd
