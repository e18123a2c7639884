#pragma once

#include "algorithms.hpp"
#include "interfaces.hpp"

namespace pqoidc {

// HKDF implementation using SHA-256 via OpenSSL.
// We do NOT reimplement SHA-256; we only orchestrate HKDF around library calls.
class HkdfSha256Provider : public HkdfProvider {
public:
    HashAlgorithm hash() const override { return HashAlgorithm::SHA2_256; }

    Bytes derive(const Bytes &ikm,
                 const Bytes &salt,
                 const Bytes &info,
                 std::size_t out_len) const override;
};

constexpr std::size_t kSessionNonceSize = 16;
constexpr std::size_t kEncryptionKeySize = 32;
constexpr std::size_t kMacKeySize = 32;
constexpr std::size_t kIvSize = 16;

struct SessionKeys {
    Bytes encryption_key; // 32 bytes
    Bytes mac_key;        // 32 bytes
    Bytes iv;             // 16 bytes
};

// Session key derivation for a completed KEM exchange:
//   context     = client_nonce || server_nonce
//   key_material = HKDF-SHA256(IKM=shared_secret, salt="KEMTLS-Session-Keys",
//                              info="PQ-OIDC-v1|" || context, 80 bytes)
//   encryption_key = key_material[0..32), mac_key = [32..64), iv = [64..80)
// Both peers compute identical keys from identical inputs; the nonce order is
// fixed, not negotiated.
SessionKeys derive_session_keys(const Bytes &shared_secret,
                                const Bytes &client_nonce,
                                const Bytes &server_nonce,
                                const HkdfProvider &hkdf);

} // namespace pqoidc
