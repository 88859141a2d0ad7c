#pragma once

#ifdef __cplusplus

#include <array>
#include <cstdint>
#include <string>

namespace strata {

using sha256_digest = std::array<uint8_t, 32>;

sha256_digest sha256(const void* data, size_t len);

/// Lowercase hex SHA-256 of `text`.
std::string sha256_hex(const std::string& text);

sha256_digest hmac_sha256(const void* key, size_t key_len, const std::string& msg);

std::string to_hex(const uint8_t* data, size_t len);

inline std::string to_hex(const sha256_digest& digest) {
    return to_hex(digest.data(), digest.size());
}

} // namespace strata

#endif // __cplusplus
