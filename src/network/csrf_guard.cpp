#include "network/csrf_guard.hpp"
#include "crypto/digest.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace bucketd {
namespace network {

namespace http = boost::beast::http;

namespace {

std::string to_string(const std::vector<uint8_t>& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

std::string trim(const std::string& value) {
  std::size_t first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return "";
  }
  std::size_t last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

} // namespace


//==============================================
// CONSTRUCTOR
//==============================================

CsrfGuard::CsrfGuard(const std::string& key, RequestHandler& next)
  : key_(key.begin(), key.end())
  , next_(next) {
  if (key_.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "CSRF guard: Invalid key size: " << key_.size() << " bytes. Expected "
                             << KEY_SIZE << " bytes.";
    throw std::invalid_argument("CSRF guard: Invalid key size");
  }
  BOOST_LOG_TRIVIAL(info) << "CSRF guard: Enabled";
}


//==============================================
// REQUEST HANDLING
//==============================================

Response CsrfGuard::handle(const Request& request) {
  std::optional<std::vector<uint8_t>> token;
  if (auto cookie = find_cookie(request)) {
    token = verify_cookie(*cookie);
    if (!token) {
      BOOST_LOG_TRIVIAL(warning) << "CSRF guard: Discarding cookie with a bad signature";
    }
  }

  const bool issue_cookie = !token;
  if (issue_cookie) {
    token = crypto::random_bytes(TOKEN_SIZE);
  }

  Response response;
  if (is_safe_method(request)) {
    response = next_.handle(request);
    response.set(TOKEN_HEADER, mask_token(*token));
  } else if (issue_cookie) {
    response = reject(request, "no valid cookie");
  } else {
    auto header = request.find(TOKEN_HEADER);
    if (header == request.end()) {
      response = reject(request, "missing token header");
    } else {
      auto submitted = unmask_token(std::string(header->value()));
      if (!submitted || !crypto::constant_time_equal(*submitted, *token)) {
        response = reject(request, "token mismatch");
      } else {
        response = next_.handle(request);
      }
    }
  }

  if (issue_cookie) {
    response.insert(http::field::set_cookie,
                    std::string(COOKIE_NAME) + "=" + sign_token(*token) + "; Path=/; HttpOnly; SameSite=Lax");
  }
  response.set(http::field::vary, "Cookie");
  return response;
}


//==============================================
// TOKEN ENCODING
//==============================================

std::string CsrfGuard::sign_token(const std::vector<uint8_t>& token) const {
  std::vector<uint8_t> signed_token = token;
  std::vector<uint8_t> mac = crypto::hmac_sha256(key_, to_string(token));
  signed_token.insert(signed_token.end(), mac.begin(), mac.end());
  return crypto::base64_encode(signed_token);
}

std::optional<std::vector<uint8_t>> CsrfGuard::verify_cookie(const std::string& cookie_value) const {
  std::vector<uint8_t> decoded;
  try {
    decoded = crypto::base64_decode(cookie_value);
  } catch (const crypto::EncodingError& e) {
    BOOST_LOG_TRIVIAL(debug) << "CSRF guard: " << e.what();
    return std::nullopt;
  }
  if (decoded.size() != TOKEN_SIZE + crypto::SHA256_SIZE) {
    return std::nullopt;
  }

  std::vector<uint8_t> token(decoded.begin(), decoded.begin() + TOKEN_SIZE);
  std::vector<uint8_t> mac(decoded.begin() + TOKEN_SIZE, decoded.end());
  if (!crypto::constant_time_equal(mac, crypto::hmac_sha256(key_, to_string(token)))) {
    return std::nullopt;
  }
  return token;
}

std::string CsrfGuard::mask_token(const std::vector<uint8_t>& token) {
  std::vector<uint8_t> masked = crypto::random_bytes(token.size());
  for (std::size_t i = 0; i < token.size(); ++i) {
    masked.push_back(masked[i] ^ token[i]);
  }
  return crypto::base64_encode(masked);
}

std::optional<std::vector<uint8_t>> CsrfGuard::unmask_token(const std::string& masked) {
  std::vector<uint8_t> decoded;
  try {
    decoded = crypto::base64_decode(masked);
  } catch (const crypto::EncodingError& e) {
    BOOST_LOG_TRIVIAL(debug) << "CSRF guard: " << e.what();
    return std::nullopt;
  }
  if (decoded.size() != 2 * TOKEN_SIZE) {
    return std::nullopt;
  }

  std::vector<uint8_t> token(TOKEN_SIZE);
  for (std::size_t i = 0; i < TOKEN_SIZE; ++i) {
    token[i] = decoded[i] ^ decoded[TOKEN_SIZE + i];
  }
  return token;
}


//==============================================
// HELPERS
//==============================================

bool CsrfGuard::is_safe_method(const Request& request) {
  switch (request.method()) {
    case http::verb::get:
    case http::verb::head:
    case http::verb::options:
    case http::verb::trace:
      return true;
    default:
      return false;
  }
}

std::optional<std::string> CsrfGuard::find_cookie(const Request& request) {
  const std::string prefix = std::string(COOKIE_NAME) + "=";

  auto range = request.equal_range(http::field::cookie);
  for (auto it = range.first; it != range.second; ++it) {
    const std::string header(it->value());
    std::size_t start = 0;
    while (start < header.size()) {
      std::size_t end = header.find(';', start);
      if (end == std::string::npos) {
        end = header.size();
      }
      std::string pair = trim(header.substr(start, end - start));
      if (pair.compare(0, prefix.size(), prefix) == 0) {
        return pair.substr(prefix.size());
      }
      start = end + 1;
    }
  }
  return std::nullopt;
}

Response CsrfGuard::reject(const Request& request, const std::string& reason) const {
  BOOST_LOG_TRIVIAL(warning) << "CSRF guard: Rejected " << request.method_string() << " "
                             << request.target() << ": " << reason;
  return make_error_response(request, http::status::forbidden, "Forbidden - CSRF token invalid");
}

} // namespace network
} // namespace bucketd
