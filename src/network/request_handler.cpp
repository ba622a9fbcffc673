#include "network/request_handler.hpp"

namespace bucketd {
namespace network {

namespace http = boost::beast::http;

Response make_error_response(const Request& request, http::status status, const std::string& message) {
  Response response{status, request.version()};
  response.keep_alive(request.keep_alive());
  response.set(http::field::content_type, "text/plain; charset=utf-8");
  response.body() = message + "\n";
  response.prepare_payload();
  return response;
}

} // namespace network
} // namespace bucketd
