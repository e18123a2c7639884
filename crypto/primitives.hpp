#pragma once

#include "algorithms.hpp"

#include <cstddef>
#include <string>

namespace pqoidc {

// Cryptographically secure random bytes (OpenSSL RAND_bytes).
Bytes random_bytes(std::size_t len);

inline Bytes generate_nonce(std::size_t len = 16) { return random_bytes(len); }

// URL-safe unpadded base64 of `len` random bytes. Used for authorization
// codes, session ids, access tokens, state and nonce values.
std::string random_token(std::size_t len = 32);

constexpr std::size_t kSha256Size = 32;

Bytes sha256(const Bytes &data);

// Length leaks; contents do not.
bool constant_time_equal(const Bytes &a, const Bytes &b);
bool constant_time_equal(const std::string &a, const std::string &b);

std::string to_hex(const Bytes &data);
Bytes from_hex(const std::string &hex);

std::string base64url_encode(const Bytes &data);
inline std::string base64url_encode(const std::string &data) {
    return base64url_encode(Bytes(data.begin(), data.end()));
}
Bytes base64url_decode(const std::string &text);

} // namespace pqoidc
