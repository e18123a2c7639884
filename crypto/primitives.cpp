#include "primitives.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <stdexcept>

namespace pqoidc {

Bytes random_bytes(std::size_t len) {
    Bytes out(len);
    if (len == 0) {
        return out;
    }
    if (RAND_bytes(out.data(), static_cast<int>(len)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

std::string random_token(std::size_t len) {
    return base64url_encode(random_bytes(len));
}

Bytes sha256(const Bytes &data) {
    Bytes out(kSha256Size);
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1 ||
        len != kSha256Size) {
        throw std::runtime_error("EVP_Digest(SHA-256) failed");
    }
    return out;
}

bool constant_time_equal(const Bytes &a, const Bytes &b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool constant_time_equal(const std::string &a, const std::string &b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string to_hex(const Bytes &data) {
    static const char *hex = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (auto b : data) {
        out.push_back(hex[(b >> 4) & 0x0F]);
        out.push_back(hex[b & 0x0F]);
    }
    return out;
}

Bytes from_hex(const std::string &hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string has odd length");
    }
    Bytes out(hex.size() / 2);
    for (std::size_t i = 0; i < out.size(); ++i) {
        auto nybble = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
            if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
            throw std::invalid_argument("invalid hex digit");
        };
        int hi = nybble(hex[2 * i]);
        int lo = nybble(hex[2 * i + 1]);
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return out;
}

std::string base64url_encode(const Bytes &data) {
    if (data.empty()) {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                            data.data(), static_cast<int>(data.size()));
    if (n < 0) {
        throw std::runtime_error("EVP_EncodeBlock failed");
    }
    out.resize(static_cast<std::size_t>(n));

    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    for (auto &c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

Bytes base64url_decode(const std::string &text) {
    if (text.empty()) {
        return {};
    }
    if (text.size() % 4 == 1) {
        throw std::invalid_argument("invalid base64url length");
    }

    std::string std_b64;
    std_b64.reserve(text.size() + 3);
    for (char c : text) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
            std_b64.push_back(c);
        } else if (c == '-') {
            std_b64.push_back('+');
        } else if (c == '_') {
            std_b64.push_back('/');
        } else {
            throw std::invalid_argument("invalid base64url character");
        }
    }
    std::size_t pad = (4 - std_b64.size() % 4) % 4;
    std_b64.append(pad, '=');

    Bytes out(std_b64.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char *>(std_b64.data()),
                            static_cast<int>(std_b64.size()));
    if (n < 0) {
        throw std::invalid_argument("base64url decode failed");
    }
    // EVP_DecodeBlock counts the zero bytes produced by '=' padding.
    out.resize(static_cast<std::size_t>(n) - pad);

    // Unused low bits of the final character must be zero, so each byte
    // string has exactly one accepted encoding.
    if (base64url_encode(out) != text) {
        throw std::invalid_argument("non-canonical base64url encoding");
    }
    return out;
}

} // namespace pqoidc
