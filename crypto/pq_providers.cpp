#include "interfaces.hpp"
#include "factories.hpp"

#include <oqs/oqs.h>

#include <stdexcept>
#include <string>

namespace pqoidc {

namespace {

const char *oqs_kem_name(KemAlgorithm alg) {
    switch (alg) {
    case KemAlgorithm::MlKem512: return OQS_KEM_alg_ml_kem_512;
    case KemAlgorithm::MlKem768: return OQS_KEM_alg_ml_kem_768;
    case KemAlgorithm::MlKem1024: return OQS_KEM_alg_ml_kem_1024;
    }
    throw std::invalid_argument("unknown KEM algorithm");
}

const char *oqs_sig_name(SigAlgorithm alg) {
    switch (alg) {
    case SigAlgorithm::MlDsa44: return OQS_SIG_alg_ml_dsa_44;
    case SigAlgorithm::MlDsa65: return OQS_SIG_alg_ml_dsa_65;
    case SigAlgorithm::MlDsa87: return OQS_SIG_alg_ml_dsa_87;
    case SigAlgorithm::Falcon512: return OQS_SIG_alg_falcon_512;
    case SigAlgorithm::Falcon1024: return OQS_SIG_alg_falcon_1024;
    }
    throw std::invalid_argument("unknown signature algorithm");
}

class OqsKemProvider : public KemProvider {
public:
    explicit OqsKemProvider(KemAlgorithm alg) : alg_(alg) {
        const char *name = oqs_kem_name(alg);
        if (!OQS_KEM_alg_is_enabled(name)) {
            throw std::runtime_error(std::string(name) + " KEM not enabled in liboqs");
        }
        kem_ = OQS_KEM_new(name);
        if (!kem_) {
            throw std::runtime_error(std::string("OQS_KEM_new(") + name + ") failed");
        }
    }

    ~OqsKemProvider() override {
        if (kem_) {
            OQS_KEM_free(kem_);
            kem_ = nullptr;
        }
    }

    OqsKemProvider(const OqsKemProvider &) = delete;
    OqsKemProvider &operator=(const OqsKemProvider &) = delete;

    KemAlgorithm algorithm() const override { return alg_; }

    std::size_t public_key_size() const override { return kem_->length_public_key; }
    std::size_t secret_key_size() const override { return kem_->length_secret_key; }
    std::size_t ciphertext_size() const override { return kem_->length_ciphertext; }
    std::size_t shared_secret_size() const override { return kem_->length_shared_secret; }

    KemKeyPair generate_keypair() const override {
        KemKeyPair kp;
        kp.public_key.resize(kem_->length_public_key);
        kp.secret_key.resize(kem_->length_secret_key);
        if (OQS_KEM_keypair(kem_, kp.public_key.data(), kp.secret_key.data()) != OQS_SUCCESS) {
            throw std::runtime_error("OQS_KEM_keypair failed");
        }
        return kp;
    }

    Encapsulation encapsulate(const Bytes &public_key) const override {
        if (public_key.size() != kem_->length_public_key) {
            throw std::invalid_argument(kem_algorithm_name(alg_) + " public key size mismatch");
        }

        Encapsulation out;
        out.ciphertext.resize(kem_->length_ciphertext);
        out.shared_secret.resize(kem_->length_shared_secret);
        if (OQS_KEM_encaps(kem_, out.ciphertext.data(), out.shared_secret.data(),
                           public_key.data()) != OQS_SUCCESS) {
            throw std::runtime_error("OQS_KEM_encaps failed");
        }
        return out;
    }

    Bytes decapsulate(const Bytes &ciphertext, const Bytes &secret_key) const override {
        if (ciphertext.size() != kem_->length_ciphertext) {
            throw std::invalid_argument(kem_algorithm_name(alg_) + " ciphertext size mismatch");
        }
        if (secret_key.size() != kem_->length_secret_key) {
            throw std::invalid_argument(kem_algorithm_name(alg_) + " secret key size mismatch");
        }

        Bytes shared(kem_->length_shared_secret);
        if (OQS_KEM_decaps(kem_, shared.data(), ciphertext.data(),
                           secret_key.data()) != OQS_SUCCESS) {
            throw std::runtime_error("OQS_KEM_decaps failed");
        }
        return shared;
    }

private:
    KemAlgorithm alg_;
    OQS_KEM *kem_{nullptr};
};

class OqsSignatureProvider : public SignatureProvider {
public:
    explicit OqsSignatureProvider(SigAlgorithm alg) : alg_(alg) {
        const char *name = oqs_sig_name(alg);
        if (!OQS_SIG_alg_is_enabled(name)) {
            throw std::runtime_error(std::string(name) + " not enabled in liboqs");
        }
        sig_ = OQS_SIG_new(name);
        if (!sig_) {
            throw std::runtime_error(std::string("OQS_SIG_new(") + name + ") failed");
        }
    }

    ~OqsSignatureProvider() override {
        if (sig_) {
            OQS_SIG_free(sig_);
            sig_ = nullptr;
        }
    }

    OqsSignatureProvider(const OqsSignatureProvider &) = delete;
    OqsSignatureProvider &operator=(const OqsSignatureProvider &) = delete;

    SigAlgorithm algorithm() const override { return alg_; }

    std::size_t public_key_size() const override { return sig_->length_public_key; }
    std::size_t secret_key_size() const override { return sig_->length_secret_key; }
    std::size_t signature_size() const override { return sig_->length_signature; }

    SigKeyPair generate_keypair() const override {
        SigKeyPair kp;
        kp.public_key.resize(sig_->length_public_key);
        kp.secret_key.resize(sig_->length_secret_key);
        if (OQS_SIG_keypair(sig_, kp.public_key.data(), kp.secret_key.data()) != OQS_SUCCESS) {
            throw std::runtime_error("OQS_SIG_keypair failed");
        }
        return kp;
    }

    Bytes sign(const Bytes &secret_key, const Bytes &msg) const override {
        if (secret_key.size() != sig_->length_secret_key) {
            throw std::invalid_argument(sig_algorithm_name(alg_) + " secret key size mismatch");
        }

        // Falcon signatures are variable length; length_signature is the maximum.
        size_t sig_len = sig_->length_signature;
        Bytes out(sig_len);
        if (OQS_SIG_sign(sig_, out.data(), &sig_len,
                         msg.data(), msg.size(), secret_key.data()) != OQS_SUCCESS) {
            throw std::runtime_error("OQS_SIG_sign failed");
        }
        out.resize(sig_len);
        return out;
    }

    bool verify(const Bytes &public_key, const Bytes &msg,
                const Bytes &signature) const override {
        if (public_key.size() != sig_->length_public_key) {
            return false;
        }
        if (signature.empty() || signature.size() > sig_->length_signature) {
            return false;
        }
        int rc = OQS_SIG_verify(sig_, msg.data(), msg.size(),
                                signature.data(), signature.size(),
                                public_key.data());
        return rc == OQS_SUCCESS;
    }

private:
    SigAlgorithm alg_;
    OQS_SIG *sig_{nullptr};
};

} // namespace

std::unique_ptr<KemProvider> make_kem_provider(KemAlgorithm alg) {
    return std::make_unique<OqsKemProvider>(alg);
}

std::unique_ptr<SignatureProvider> make_signature_provider(SigAlgorithm alg) {
    return std::make_unique<OqsSignatureProvider>(alg);
}

} // namespace pqoidc
