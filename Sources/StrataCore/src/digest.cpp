#include "strata/digest.hpp"
#include "strata/errors.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace strata {

sha256_digest sha256(const void* data, size_t len) {
    sha256_digest out{};
    unsigned int out_len = 0;
    if (EVP_Digest(data, len, out.data(), &out_len, EVP_sha256(), nullptr) != 1 || out_len != out.size()) {
        throw strata_error("SHA-256 digest failed");
    }
    return out;
}

std::string sha256_hex(const std::string& text) {
    return to_hex(sha256(text.data(), text.size()));
}

sha256_digest hmac_sha256(const void* key, size_t key_len, const std::string& msg) {
    sha256_digest out{};
    unsigned int out_len = 0;
    if (!HMAC(EVP_sha256(), key, static_cast<int>(key_len),
              reinterpret_cast<const unsigned char*>(msg.data()), msg.size(),
              out.data(), &out_len) || out_len != out.size()) {
        throw strata_error("HMAC-SHA256 failed");
    }
    return out;
}

std::string to_hex(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0f]);
    }
    return hex;
}

} // namespace strata
