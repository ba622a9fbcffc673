#include "protocol/path_resolver.hpp"

namespace bucketd {
namespace protocol {

Segments split_path(const std::string& escaped_path) {
  Segments segments{ROOT_SEGMENT};

  std::size_t start = 0;
  while (start <= escaped_path.size()) {
    std::size_t end = escaped_path.find('/', start);
    if (end == std::string::npos) {
      end = escaped_path.size();
    }
    if (end > start) {
      segments.emplace_back(escaped_path, start, end - start);
    }
    start = end + 1;
  }
  return segments;
}

std::string request_path(const std::string& target) {
  return target.substr(0, target.find_first_of("?#"));
}

std::string canonical_path(const Segments& segments) {
  std::string path;
  for (std::size_t i = 1; i < segments.size(); ++i) {
    path += '/';
    path += segments[i];
  }
  return path.empty() ? ROOT_SEGMENT : path;
}

std::size_t depth(const Segments& segments) {
  return segments.empty() ? 0 : segments.size() - 1;
}

} // namespace protocol
} // namespace bucketd
