#ifndef BUCKETD_NETWORK_HTTP_ERROR_HPP
#define BUCKETD_NETWORK_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>
#include <boost/beast/http/status.hpp>

namespace bucketd {
namespace network {

// Request failure that already knows its response status. what() is the response body
class HttpError : public std::runtime_error {
public:
    HttpError(boost::beast::http::status status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    boost::beast::http::status status() const { return status_; }

private:
    boost::beast::http::status status_;
};

class BadRequest : public HttpError {
public:
    explicit BadRequest(const std::string& message)
        : HttpError(boost::beast::http::status::bad_request, message) {}
};

class NotFound : public HttpError {
public:
    explicit NotFound(const std::string& message = "Not found.")
        : HttpError(boost::beast::http::status::not_found, message) {}
};

class Conflict : public HttpError {
public:
    explicit Conflict(const std::string& message)
        : HttpError(boost::beast::http::status::conflict, message) {}
};

class LengthRequired : public HttpError {
public:
    explicit LengthRequired(const std::string& message = "Length required.")
        : HttpError(boost::beast::http::status::length_required, message) {}
};

class PreconditionFailed : public HttpError {
public:
    explicit PreconditionFailed(const std::string& message = "Precondition failed.")
        : HttpError(boost::beast::http::status::precondition_failed, message) {}
};

class RangeNotSatisfiable : public HttpError {
public:
    explicit RangeNotSatisfiable(const std::string& message)
        : HttpError(boost::beast::http::status::range_not_satisfiable, message) {}
};

class InternalError : public HttpError {
public:
    explicit InternalError(const std::string& message = "Internal server error.")
        : HttpError(boost::beast::http::status::internal_server_error, message) {}
};

} // namespace network
} // namespace bucketd

#endif // BUCKETD_NETWORK_HTTP_ERROR_HPP
