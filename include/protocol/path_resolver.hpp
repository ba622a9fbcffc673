#ifndef BUCKETD_PROTOCOL_PATH_RESOLVER_HPP
#define BUCKETD_PROTOCOL_PATH_RESOLVER_HPP

#include <string>
#include <vector>

namespace bucketd {
namespace protocol {

// First element is always the synthetic root segment "/"
using Segments = std::vector<std::string>;

static constexpr const char* ROOT_SEGMENT = "/";

// Splits an escaped URL path into the root segment plus one segment per non-empty component.
// Percent escapes are kept as they are, so "a%2fb" stays a single segment
Segments split_path(const std::string& escaped_path);

// Drops the query string and fragment of a request target
std::string request_path(const std::string& target);

// "/" followed by the non-root segments joined with "/"
std::string canonical_path(const Segments& segments);

// Number of segments below the root
std::size_t depth(const Segments& segments);

} // namespace protocol
} // namespace bucketd

#endif // BUCKETD_PROTOCOL_PATH_RESOLVER_HPP
