#pragma once

#include "../crypto/algorithms.hpp"
#include "../crypto/interfaces.hpp"

#include <optional>
#include <string>

namespace pqoidc {

// Single-level, self-signed server certificate. Binds a subject name to a KEM
// public key and a signature public key. A successful verify() proves only
// that the subject and both keys were signed together by the holder of the
// embedded signature key; there is no CA chain.
class Certificate {
public:
    Certificate(std::string subject,
                KemAlgorithm kem_algorithm,
                SigAlgorithm sig_algorithm,
                Bytes kem_public_key,
                Bytes sig_public_key,
                std::optional<Bytes> signature = std::nullopt);

    const std::string &subject() const { return subject_; }
    KemAlgorithm kem_algorithm() const { return kem_algorithm_; }
    SigAlgorithm sig_algorithm() const { return sig_algorithm_; }
    const Bytes &kem_public_key() const { return kem_public_key_; }
    const Bytes &sig_public_key() const { return sig_public_key_; }
    const std::optional<Bytes> &signature() const { return signature_; }

    // "subject|hex(kem_public_key)|hex(sig_public_key)"
    Bytes tbs_data() const;

    void sign(const SignatureProvider &signer, const Bytes &sig_secret_key);

    // False when unsigned, when the provider's algorithm differs from the
    // declared one, or when the signature does not verify.
    bool verify(const SignatureProvider &verifier) const;

    // Resolves a provider from the declared signature algorithm.
    bool verify() const;

    // Binary encoding carried inside SERVER_HELLO. Throws CertificateError.
    Bytes to_bytes() const;
    static Certificate from_bytes(const Bytes &data);

    // {"subject", "kem_alg", "sig_alg", "kem_pk", "sig_pk", "signature"?}
    // with hex-encoded keys. Throws CertificateError.
    std::string to_json() const;
    static Certificate from_json(const std::string &json);

private:
    std::string subject_;
    KemAlgorithm kem_algorithm_;
    SigAlgorithm sig_algorithm_;
    Bytes kem_public_key_;
    Bytes sig_public_key_;
    std::optional<Bytes> signature_;
};

// Generates long-term KEM and signature keys for `subject` and returns the
// signed certificate. The signing key is discarded after use.
Certificate issue_server_certificate(const std::string &subject, const CryptoSuite &suite);

} // namespace pqoidc
