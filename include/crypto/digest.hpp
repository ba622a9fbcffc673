#ifndef BUCKETD_CRYPTO_DIGEST_HPP
#define BUCKETD_CRYPTO_DIGEST_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include "crypto_error.hpp"

namespace bucketd {
namespace crypto {

static constexpr size_t SHA256_SIZE = 32;

// Owns one OpenSSL message digest context
class DigestContext {
public:
  DigestContext();
  ~DigestContext();

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx_; }

private:
  EVP_MD_CTX* ctx_;
};

// ---- DIGESTS ----
// SHA-256 of the given bytes using OpenSSL EVP
std::vector<uint8_t> sha256(const std::string& data);
// HMAC-SHA256 of data under key
std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& data);
// Entity tag of a stored value: base64 of its SHA-256 digest
std::string etag(const std::string& data);


// ---- ENCODING ----
std::string base64_encode(const std::vector<uint8_t>& data);
// Throws EncodingError on malformed input
std::vector<uint8_t> base64_decode(const std::string& encoded);


// ---- RANDOMNESS AND COMPARISON ----
// Cryptographically secure random bytes from OpenSSL RAND
std::vector<uint8_t> random_bytes(size_t count);
// Compares without leaking the position of the first difference
bool constant_time_equal(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b);

} // namespace crypto
} // namespace bucketd

#endif // BUCKETD_CRYPTO_DIGEST_HPP
