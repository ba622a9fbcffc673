#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "network/request_handler.hpp"
#include "protocol/path_resolver.hpp"
#include "store/metadata_store.hpp"
#include "store/store.hpp"

namespace bucketd {
namespace network {

// Maps HTTP verbs onto the namespace tree. Every request runs inside exactly one
// engine transaction that is committed or rolled back before the response is returned
class Router : public RequestHandler {
public:
  static constexpr const char* ALLOWED_METHODS = "GET,PUT,DELETE,HEAD";

  // -- CONSTRUCTOR ----
  explicit Router(store::Database& database);


  // ---- REQUEST HANDLING ----
  // Never throws. Every failure becomes a plain-text error response
  Response handle(const Request& request) override;

private:

  // ---- PARAMETERS ----
  store::Database& database_;


  // ---- DISPATCH ----
  Response dispatch(const Request& request);


  // ---- VERBS ----
  Response handle_head(const Request& request, const std::string& path);
  Response handle_options(const Request& request);
  Response handle_get(const Request& request, const std::string& path);
  Response handle_put(const Request& request, const std::string& path);
  Response handle_delete(const Request& request, const std::string& path);
  Response handle_unsupported(const Request& request);


  // ---- HELPERS ----
  // Rejects oversized bodies and any If-None-Match on mutating requests
  void check_put_or_delete_headers(const Request& request);
  Response list_container(const Request& request, const std::string& path, const store::Bucket& container);
  Response serve_value(const Request& request, const std::string& value,
                       const std::optional<store::MetadataRecord>& record);
};

} // namespace network
} // namespace bucketd
