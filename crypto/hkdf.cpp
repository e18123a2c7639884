#include "hkdf.hpp"
#include "factories.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>

#include <stdexcept>
#include <string>

namespace pqoidc {

Bytes HkdfSha256Provider::derive(const Bytes &ikm,
                                 const Bytes &salt,
                                 const Bytes &info,
                                 std::size_t out_len) const {
    Bytes out(out_len);

    // HKDF with SHA-256 via OpenSSL EVP_PKEY API.
    EVP_PKEY_CTX *pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!pctx) {
        throw std::runtime_error("EVP_PKEY_CTX_new_id failed");
    }

    if (EVP_PKEY_derive_init(pctx) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(pctx, EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_salt(pctx, salt.data(), static_cast<int>(salt.size())) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(pctx, ikm.data(), static_cast<int>(ikm.size())) <= 0 ||
        EVP_PKEY_CTX_add1_hkdf_info(pctx, info.data(), static_cast<int>(info.size())) <= 0) {
        EVP_PKEY_CTX_free(pctx);
        throw std::runtime_error("HKDF-SHA256 initialization failed");
    }

    size_t len = out_len;
    if (EVP_PKEY_derive(pctx, out.data(), &len) <= 0 || len != out_len) {
        EVP_PKEY_CTX_free(pctx);
        throw std::runtime_error("HKDF-SHA256 derive failed");
    }

    EVP_PKEY_CTX_free(pctx);
    return out;
}

std::unique_ptr<HkdfProvider> make_hkdf_sha256_provider() {
    return std::make_unique<HkdfSha256Provider>();
}

SessionKeys derive_session_keys(const Bytes &shared_secret,
                                const Bytes &client_nonce,
                                const Bytes &server_nonce,
                                const HkdfProvider &hkdf) {
    if (shared_secret.empty()) {
        throw std::invalid_argument("shared secret is empty");
    }
    if (client_nonce.size() != kSessionNonceSize || server_nonce.size() != kSessionNonceSize) {
        throw std::invalid_argument("session nonces must be 16 bytes");
    }

    static const std::string salt_str = "KEMTLS-Session-Keys";
    static const std::string info_prefix = "PQ-OIDC-v1|";

    const Bytes salt(salt_str.begin(), salt_str.end());

    Bytes info(info_prefix.begin(), info_prefix.end());
    info.reserve(info.size() + client_nonce.size() + server_nonce.size());
    info.insert(info.end(), client_nonce.begin(), client_nonce.end());
    info.insert(info.end(), server_nonce.begin(), server_nonce.end());

    const std::size_t total = kEncryptionKeySize + kMacKeySize + kIvSize;
    Bytes material = hkdf.derive(shared_secret, salt, info, total);

    auto first = material.begin();
    SessionKeys keys;
    keys.encryption_key.assign(first, first + kEncryptionKeySize);
    keys.mac_key.assign(first + kEncryptionKeySize, first + kEncryptionKeySize + kMacKeySize);
    keys.iv.assign(first + kEncryptionKeySize + kMacKeySize, material.end());
    return keys;
}

} // namespace pqoidc
