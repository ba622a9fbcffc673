#pragma once

#include <cstddef>
#include <string>
#include <boost/beast/http.hpp>

namespace bucketd {
namespace network {

using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

// Largest request body read into memory and accepted by a PUT
constexpr std::size_t MAX_BODY_SIZE = 1 << 24;

// Turns one parsed request into one response. Implementations are called concurrently
// from every connection thread
class RequestHandler {
public:
    virtual ~RequestHandler() = default;

    virtual Response handle(const Request& request) = 0;
};

// Plain-text response carrying message plus a newline
Response make_error_response(const Request& request, boost::beast::http::status status,
                             const std::string& message);

} // namespace network
} // namespace bucketd
