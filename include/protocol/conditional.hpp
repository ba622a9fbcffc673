#ifndef BUCKETD_PROTOCOL_CONDITIONAL_HPP
#define BUCKETD_PROTOCOL_CONDITIONAL_HPP

#include <optional>
#include <string>
#include <vector>

namespace bucketd {
namespace protocol {

// Entity tags listed by a precondition header. Absent when the request did not carry the header
using EntityTags = std::optional<std::vector<std::string>>;

// Splits every occurrence of a header on commas and trims the entries
std::vector<std::string> parse_entity_tags(const std::vector<std::string>& header_values);

// True when a read must answer "not modified": the header lists "*" or the stored tag
bool if_none_match_hits(const EntityTags& if_none_match, const std::string& stored_etag);

// Whether a write or delete may proceed. stored_etag is absent when nothing is stored at the path,
// in which case "*" fails because it requires an existing resource
bool if_match_holds(const EntityTags& if_match, const std::optional<std::string>& stored_etag);

} // namespace protocol
} // namespace bucketd

#endif // BUCKETD_PROTOCOL_CONDITIONAL_HPP
