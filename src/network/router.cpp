#include "network/router.hpp"
#include "network/http_error.hpp"
#include "crypto/digest.hpp"
#include "protocol/conditional.hpp"
#include "protocol/negotiator.hpp"
#include "protocol/range.hpp"
#include "store/metadata_store.hpp"
#include "store/navigator.hpp"

#include <boost/log/trivial.hpp>

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace bucketd {
namespace network {

namespace http = boost::beast::http;

namespace {

// RFC 1123 with a numeric zone, always UTC
std::string http_date(std::chrono::system_clock::time_point time) {
  std::time_t seconds = std::chrono::system_clock::to_time_t(time);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  char buffer[64];
  std::size_t written = std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S +0000", &utc);
  return std::string(buffer, written);
}

std::vector<std::string> header_values(const Request& request, http::field field) {
  std::vector<std::string> values;
  auto range = request.equal_range(field);
  for (auto it = range.first; it != range.second; ++it) {
    values.emplace_back(it->value());
  }
  return values;
}

// Absent when the request does not carry the header at all
protocol::EntityTags entity_tags(const Request& request, http::field field) {
  if (request.find(field) == request.end()) {
    return std::nullopt;
  }
  return protocol::parse_entity_tags(header_values(request, field));
}

std::optional<std::string> stored_etag(const std::optional<store::MetadataRecord>& record) {
  if (!record) {
    return std::nullopt;
  }
  return record->etag;
}

std::vector<std::pair<std::string, std::string>> request_headers(const Request& request) {
  std::vector<std::pair<std::string, std::string>> headers;
  for (const auto& field : request) {
    headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
  }
  return headers;
}

Response make_response(const Request& request, http::status status) {
  Response response{status, request.version()};
  response.keep_alive(request.keep_alive());
  return response;
}

// Segments without the last one, the root segment always kept
protocol::Segments parent_segments(const protocol::Segments& segments) {
  if (segments.size() <= 1) {
    return segments;
  }
  return protocol::Segments(segments.begin(), segments.end() - 1);
}

} // namespace


//==============================================
// CONSTRUCTOR
//==============================================

Router::Router(store::Database& database) : database_(database) {
  BOOST_LOG_TRIVIAL(info) << "Router: Initialized on "
                          << (database.in_memory() ? std::string("in-memory database") : database.path().string());
}


//==============================================
// REQUEST HANDLING
//==============================================

Response Router::handle(const Request& request) {
  BOOST_LOG_TRIVIAL(info) << "Router: " << request.method_string() << " " << request.target();

  Response response;
  try {
    response = dispatch(request);
  } catch (const HttpError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Router: Request failed with " << static_cast<unsigned>(e.status()) << ": " << e.what();
    response = make_error_response(request, e.status(), e.what());
  } catch (const store::IncompatibleValue& e) {
    BOOST_LOG_TRIVIAL(debug) << "Router: " << e.what();
    response = make_error_response(request, http::status::conflict, "Incompatible value.");
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Router: Storage error on " << request.target() << ": " << e.what();
    response = make_error_response(request, http::status::internal_server_error, "Internal server error.");
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Router: Unexpected error on " << request.target() << ": " << e.what();
    response = make_error_response(request, http::status::internal_server_error, "Internal server error.");
  }

  // HEAD keeps the announced Content-Length but never sends a body
  if (request.method() == http::verb::head) {
    response.body().clear();
  }
  return response;
}

Response Router::dispatch(const Request& request) {
  const std::string path = protocol::request_path(std::string(request.target()));

  switch (request.method()) {
    case http::verb::head:    return handle_head(request, path);
    case http::verb::options: return handle_options(request);
    case http::verb::get:     return handle_get(request, path);
    case http::verb::put:     return handle_put(request, path);
    case http::verb::delete_: return handle_delete(request, path);
    default:                  return handle_unsupported(request);
  }
}


//==============================================
// VERBS
//==============================================

Response Router::handle_head(const Request& request, const std::string& path) {
  const std::string key = protocol::canonical_path(protocol::split_path(path));

  auto tx = database_.begin(false);
  store::MetadataStore metadata(*tx);
  auto record = metadata.get(key);
  tx->rollback();

  if (!record) {
    throw NotFound();
  }

  Response response = make_response(request, http::status::ok);
  for (const auto& [name, value] : record->headers()) {
    response.set(name, value);
  }
  return response;
}

Response Router::handle_options(const Request& request) {
  Response response = make_response(request, http::status::ok);
  response.set(http::field::allow, ALLOWED_METHODS);
  response.prepare_payload();
  return response;
}

Response Router::handle_get(const Request& request, const std::string& path) {
  const protocol::Segments segments = protocol::split_path(path);
  const std::string key = protocol::canonical_path(segments);

  auto tx = database_.begin(false);
  store::MetadataStore metadata(*tx);
  store::Navigator navigator(*tx);

  auto record = metadata.get(key);
  if (record && protocol::if_none_match_hits(entity_tags(request, http::field::if_none_match), record->etag)) {
    Response response = make_response(request, http::status::not_modified);
    if (!record->etag.empty()) {
      response.set(http::field::etag, record->etag);
    }
    return response;
  }

  auto node = navigator.resolve(segments);
  if (!node) {
    throw NotFound();
  }

  Response response;
  if (auto* container = std::get_if<store::Container>(&*node)) {
    response = list_container(request, path, container->bucket);
  } else {
    const auto& value = std::get<store::Value>(*node);
    response = serve_value(request, *value.bytes, record);
  }
  tx->rollback();
  return response;
}

Response Router::handle_put(const Request& request, const std::string& path) {
  check_put_or_delete_headers(request);

  const std::string& body = request.body();
  const bool has_body = !body.empty();
  if (has_body && request.find(http::field::content_length) == request.end()) {
    throw LengthRequired();
  }

  const protocol::Segments segments = protocol::split_path(path);
  const std::string key = protocol::canonical_path(segments);

  auto tx = database_.begin(true);
  store::MetadataStore metadata(*tx);
  store::Navigator navigator(*tx);

  auto existing = metadata.get(key);
  if (!protocol::if_match_holds(entity_tags(request, http::field::if_match), stored_etag(existing))) {
    throw PreconditionFailed();
  }

  if (!has_body) {
    navigator.get_or_create_container_chain(segments);
    tx->commit();
    BOOST_LOG_TRIVIAL(debug) << "Router: Container chain ready at " << key;

    Response response = make_response(request, http::status::ok);
    response.prepare_payload();
    return response;
  }

  if (protocol::depth(segments) < 2) {
    throw BadRequest("Cannot PUT a value in the root bucket.");
  }

  store::Bucket container = navigator.get_or_create_container_chain(parent_segments(segments));
  container.put(segments.back(), body);

  store::MetadataRecord record = store::MetadataRecord::extract(request_headers(request));
  record.content_length = std::to_string(body.size());
  record.etag = crypto::etag(body);
  record.last_modified = http_date(std::chrono::system_clock::now());
  metadata.put(key, record);

  tx->commit();
  BOOST_LOG_TRIVIAL(debug) << "Router: Stored " << body.size() << " bytes at " << key;

  Response response = make_response(request, existing ? http::status::no_content : http::status::created);
  response.set(http::field::etag, record.etag);
  response.set(http::field::last_modified, record.last_modified);
  if (!existing) {
    response.set(http::field::location, path);
    response.prepare_payload();
  }
  return response;
}

Response Router::handle_delete(const Request& request, const std::string& path) {
  check_put_or_delete_headers(request);

  const protocol::Segments segments = protocol::split_path(path);
  if (protocol::depth(segments) < 2) {
    throw BadRequest("Invalid path.");
  }
  const std::string key = protocol::canonical_path(segments);

  auto tx = database_.begin(true);
  store::MetadataStore metadata(*tx);
  store::Navigator navigator(*tx);

  auto record = metadata.get(key);
  if (!protocol::if_match_holds(entity_tags(request, http::field::if_match), stored_etag(record))) {
    throw PreconditionFailed();
  }

  // Only values carry a record, so containers are never deleted
  if (!record) {
    throw NotFound();
  }

  auto parent = navigator.resolve_container(parent_segments(segments));
  if (!parent || !parent->get(segments.back())) {
    BOOST_LOG_TRIVIAL(error) << "Router: Metadata record without a value at " << key;
    throw InternalError();
  }

  metadata.remove(key);
  parent->remove(segments.back());
  tx->commit();
  BOOST_LOG_TRIVIAL(debug) << "Router: Deleted value " << key;
  return make_response(request, http::status::no_content);
}

Response Router::handle_unsupported(const Request& request) {
  Response response = make_error_response(request, http::status::method_not_allowed, "Method not allowed.");
  response.set(http::field::allow, ALLOWED_METHODS);
  return response;
}


//==============================================
// HELPERS
//==============================================

void Router::check_put_or_delete_headers(const Request& request) {
  auto length = request.find(http::field::content_length);
  if (length != request.end()) {
    std::uint64_t declared = 0;
    try {
      declared = std::stoull(std::string(length->value()));
    } catch (const std::exception&) {
      throw BadRequest("Bad request.");
    }
    if (declared > MAX_BODY_SIZE) {
      throw BadRequest("Request too large.");
    }
  }
  if (request.find(http::field::if_none_match) != request.end()) {
    throw PreconditionFailed();
  }
}

Response Router::list_container(const Request& request, const std::string& path, const store::Bucket& container) {
  std::vector<std::string> names;
  container.for_each([&names](const std::string& name, bool) {
    names.push_back(name);
  });

  auto format = protocol::negotiate_listing_format(std::string(request[http::field::accept]));
  protocol::Listing listing = protocol::render_listing(format, path, names);
  BOOST_LOG_TRIVIAL(debug) << "Router: Listing " << names.size() << " entries as "
                           << protocol::listing_format_to_string(format);

  Response response = make_response(request, http::status::ok);
  response.set(http::field::content_type, listing.content_type);
  response.body() = std::move(listing.body);
  response.prepare_payload();
  return response;
}

Response Router::serve_value(const Request& request, const std::string& value,
                             const std::optional<store::MetadataRecord>& record) {
  std::vector<std::pair<std::string, std::string>> headers;
  if (record) {
    headers = record->headers();
  }

  auto range_header = request.find(http::field::range);
  if (range_header == request.end()) {
    Response response = make_response(request, http::status::ok);
    for (const auto& [name, header_value] : headers) {
      response.set(name, header_value);
    }
    response.body() = value;
    response.prepare_payload();
    return response;
  }

  std::vector<protocol::ByteRange> ranges;
  try {
    ranges = protocol::parse_range_header(std::string(range_header->value()), value.size());
  } catch (const protocol::UnsatisfiableRange& e) {
    BOOST_LOG_TRIVIAL(debug) << "Router: " << e.what();
    throw RangeNotSatisfiable("Requested range not satisfiable.");
  } catch (const protocol::MalformedRange& e) {
    BOOST_LOG_TRIVIAL(debug) << "Router: " << e.what();
    throw BadRequest("Bad request.");
  }

  Response response = make_response(request, http::status::partial_content);
  for (const auto& [name, header_value] : headers) {
    if (name != "ETag" && name != "Content-Length") {
      response.set(name, header_value);
    }
  }
  if (ranges.size() == 1) {
    response.set(http::field::content_range, protocol::content_range(ranges.front(), value.size()));
  }
  response.body() = protocol::slice_ranges(value, ranges);
  response.prepare_payload();
  return response;
}

} // namespace network
} // namespace bucketd
