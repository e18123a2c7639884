#pragma once

#include "algorithms.hpp"

#include <cstddef>
#include <memory>

namespace pqoidc {

// Providers are stateless with respect to keys: key material flows in and out
// as byte buffers whose sizes are fixed by the algorithm.
class KemProvider {
public:
    virtual ~KemProvider() = default;

    virtual KemAlgorithm algorithm() const = 0;

    virtual std::size_t public_key_size() const = 0;
    virtual std::size_t secret_key_size() const = 0;
    virtual std::size_t ciphertext_size() const = 0;
    virtual std::size_t shared_secret_size() const = 0;

    virtual KemKeyPair generate_keypair() const = 0;

    // Encapsulate a fresh shared secret against the peer public key.
    virtual Encapsulation encapsulate(const Bytes &public_key) const = 0;

    virtual Bytes decapsulate(const Bytes &ciphertext,
                              const Bytes &secret_key) const = 0;
};

class SignatureProvider {
public:
    virtual ~SignatureProvider() = default;

    virtual SigAlgorithm algorithm() const = 0;

    virtual std::size_t public_key_size() const = 0;
    virtual std::size_t secret_key_size() const = 0;
    virtual std::size_t signature_size() const = 0; // upper bound

    virtual SigKeyPair generate_keypair() const = 0;

    virtual Bytes sign(const Bytes &secret_key, const Bytes &msg) const = 0;

    // Returns false for a wrong-sized key or signature instead of throwing.
    virtual bool verify(const Bytes &public_key,
                        const Bytes &msg,
                        const Bytes &signature) const = 0;
};

class HkdfProvider {
public:
    virtual ~HkdfProvider() = default;

    virtual HashAlgorithm hash() const = 0;

    // HKDF-Extract + HKDF-Expand; out_len is output key size in bytes.
    virtual Bytes derive(const Bytes &ikm,
                         const Bytes &salt,
                         const Bytes &info,
                         std::size_t out_len) const = 0;
};

struct CryptoSuite {
    std::shared_ptr<const KemProvider> kem;        // must not be null
    std::shared_ptr<const SignatureProvider> sig;  // must not be null
    std::shared_ptr<const HkdfProvider> hkdf;      // must not be null
};

} // namespace pqoidc
