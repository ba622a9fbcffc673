#ifndef BUCKETD_PROTOCOL_LISTING_TEMPLATE_HPP
#define BUCKETD_PROTOCOL_LISTING_TEMPLATE_HPP

#include <string>
#include <vector>

namespace bucketd {
namespace protocol {

// Renders the HTML page for a container listing. Each name links to base_path/name
std::string render_listing_page(const std::string& base_path, const std::vector<std::string>& names);

// Escapes &, <, >, " and ' for HTML text and attribute values
std::string html_escape(const std::string& text);

// Joins a container path and a child name with exactly one '/'
std::string join_path(const std::string& base_path, const std::string& name);

} // namespace protocol
} // namespace bucketd

#endif // BUCKETD_PROTOCOL_LISTING_TEMPLATE_HPP
