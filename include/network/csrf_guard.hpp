#ifndef BUCKETD_NETWORK_CSRF_GUARD_HPP
#define BUCKETD_NETWORK_CSRF_GUARD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "network/request_handler.hpp"

namespace bucketd {
namespace network {

// Wraps another handler with double-submit CSRF protection. The client keeps a random
// token in a signed cookie; unsafe methods must echo it in the token header
class CsrfGuard : public RequestHandler {
public:
  static constexpr const char* COOKIE_NAME = "bucketd_csrf";
  static constexpr const char* TOKEN_HEADER = "X-CSRF-Token";
  static constexpr std::size_t KEY_SIZE = 32;
  static constexpr std::size_t TOKEN_SIZE = 32;

  // -- CONSTRUCTOR ----
  // Throws std::invalid_argument unless key is exactly KEY_SIZE bytes
  CsrfGuard(const std::string& key, RequestHandler& next);


  // ---- REQUEST HANDLING ----
  Response handle(const Request& request) override;


  // ---- TOKEN ENCODING ----
  // base64(token || HMAC-SHA256(key, token))
  std::string sign_token(const std::vector<uint8_t>& token) const;
  // Token of a cookie value, or nothing if it is malformed or the signature does not match
  std::optional<std::vector<uint8_t>> verify_cookie(const std::string& cookie_value) const;

  // base64(pad || pad ^ token) with a fresh one-time pad, so the header value changes every response
  static std::string mask_token(const std::vector<uint8_t>& token);
  static std::optional<std::vector<uint8_t>> unmask_token(const std::string& masked);

private:

  // ---- PARAMETERS ----
  const std::vector<uint8_t> key_;
  RequestHandler& next_;


  // ---- HELPERS ----
  static bool is_safe_method(const Request& request);
  // Value of our cookie among every Cookie header, if present
  static std::optional<std::string> find_cookie(const Request& request);
  Response reject(const Request& request, const std::string& reason) const;
};

} // namespace network
} // namespace bucketd

#endif // BUCKETD_NETWORK_CSRF_GUARD_HPP
