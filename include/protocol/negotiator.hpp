#ifndef BUCKETD_PROTOCOL_NEGOTIATOR_HPP
#define BUCKETD_PROTOCOL_NEGOTIATOR_HPP

#include <string>
#include <vector>

namespace bucketd {
namespace protocol {

enum class ListingFormat {
  PlainText,
  Json,
  Xml,
  Html
};

struct Listing {
  std::string content_type;
  std::string body;
};

// Picks the listing representation from the Accept header by prefix.
// Anything unrecognized gets plain text
ListingFormat negotiate_listing_format(const std::string& accept);

// Renders names, in the order given, as the chosen representation
Listing render_listing(ListingFormat format, const std::string& base_path,
                       const std::vector<std::string>& names);

inline const char* listing_format_to_string(ListingFormat format) {
  switch (format) {
    case ListingFormat::PlainText: return "text";
    case ListingFormat::Json: return "json";
    case ListingFormat::Xml: return "xml";
    case ListingFormat::Html: return "html";
    default: return "unknown";
  }
}

} // namespace protocol
} // namespace bucketd

#endif // BUCKETD_PROTOCOL_NEGOTIATOR_HPP
