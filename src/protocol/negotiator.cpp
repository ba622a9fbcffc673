#include "protocol/negotiator.hpp"
#include "protocol/listing_template.hpp"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace bucketd {
namespace protocol {

namespace pt = boost::property_tree;

namespace {

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

// Names are raw key bytes, invalid UTF-8 is replaced rather than rejected
std::string render_json(const std::vector<std::string>& names) {
  return nlohmann::json(names).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

std::string render_xml(const std::vector<std::string>& names) {
  pt::ptree bucket;
  for (const auto& name : names) {
    bucket.add("key", name);
  }
  pt::ptree document;
  document.add_child("bucket", bucket);

  std::ostringstream out;
  pt::write_xml(out, document, pt::xml_writer_settings<std::string>(' ', 2));
  return out.str();
}

std::string render_text(const std::vector<std::string>& names) {
  std::string body;
  for (const auto& name : names) {
    body += name;
    body += "\n";
  }
  return body;
}

} // namespace

ListingFormat negotiate_listing_format(const std::string& accept) {
  if (starts_with(accept, "application/json")) {
    return ListingFormat::Json;
  }
  if (starts_with(accept, "application/xml")) {
    return ListingFormat::Xml;
  }
  if (starts_with(accept, "text/html")) {
    return ListingFormat::Html;
  }
  return ListingFormat::PlainText;
}

Listing render_listing(ListingFormat format, const std::string& base_path,
                       const std::vector<std::string>& names) {
  switch (format) {
    case ListingFormat::Json:
      return Listing{"application/json; charset=utf-8", render_json(names)};
    case ListingFormat::Xml:
      return Listing{"application/xml; charset=utf-8", render_xml(names)};
    case ListingFormat::Html:
      return Listing{"text/html; charset=utf-8", render_listing_page(base_path, names)};
    case ListingFormat::PlainText:
    default:
      return Listing{"text/plain; charset=utf-8", render_text(names)};
  }
}

} // namespace protocol
} // namespace bucketd
