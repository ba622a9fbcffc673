#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <boost/log/trivial.hpp>

namespace bucketd {
namespace crypto {

//==============================================
// DIGEST CONTEXT
//==============================================

DigestContext::DigestContext() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw DigestError("Failed to create hash context");
  }
}

DigestContext::~DigestContext() {
  EVP_MD_CTX_free(ctx_);
}


//==============================================
// DIGESTS
//==============================================

std::vector<uint8_t> sha256(const std::string& data) {
  DigestContext context;
  std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
  unsigned int digest_len = 0;

  if (!EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    throw DigestError("Failed to initialize hash context");
  }
  if (!EVP_DigestUpdate(context.get(), data.data(), data.size())) {
    throw DigestError("Failed to update hash");
  }
  if (!EVP_DigestFinal_ex(context.get(), digest.data(), &digest_len)) {
    throw DigestError("Failed to finalize hash");
  }

  digest.resize(digest_len);
  return digest;
}

std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& data) {
  std::vector<uint8_t> mac(EVP_MAX_MD_SIZE);
  unsigned int mac_len = 0;

  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(data.data()), data.size(),
            mac.data(), &mac_len)) {
    throw DigestError("Failed to compute HMAC");
  }

  mac.resize(mac_len);
  return mac;
}

std::string etag(const std::string& data) {
  return base64_encode(sha256(data));
}


//==============================================
// ENCODING
//==============================================

std::string base64_encode(const std::vector<uint8_t>& data) {
  if (data.empty()) {
    return "";
  }
  // 4 output characters per 3 input bytes plus the terminating NUL
  std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                data.data(), static_cast<int>(data.size()));
  if (written < 0) {
    throw EncodingError("Failed to encode base64");
  }
  encoded.resize(written);
  return encoded;
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
  if (encoded.empty()) {
    return {};
  }
  if (encoded.size() % 4 != 0) {
    throw EncodingError("Invalid base64 length: " + std::to_string(encoded.size()));
  }

  std::vector<uint8_t> decoded(3 * encoded.size() / 4);
  int written = EVP_DecodeBlock(decoded.data(),
                                reinterpret_cast<const unsigned char*>(encoded.data()),
                                static_cast<int>(encoded.size()));
  if (written < 0) {
    throw EncodingError("Invalid base64 input");
  }

  // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
  size_t padding = 0;
  for (auto it = encoded.rbegin(); it != encoded.rend() && *it == '=' && padding < 2; ++it) {
    ++padding;
  }
  decoded.resize(static_cast<size_t>(written) - padding);
  return decoded;
}


//==============================================
// RANDOMNESS AND COMPARISON
//==============================================

std::vector<uint8_t> random_bytes(size_t count) {
  std::vector<uint8_t> bytes(count);
  if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Crypto: Failed to generate " << count << " random bytes";
    throw CryptoError("Failed to generate random bytes");
  }
  return bytes;
}

bool constant_time_equal(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
  if (a.size() != b.size()) {
    return false;
  }
  return a.empty() || CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace crypto
} // namespace bucketd
