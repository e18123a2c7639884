#include "certificate.hpp"
#include "errors.hpp"
#include "wire.hpp"

#include "../common/json.hpp"
#include "../crypto/factories.hpp"
#include "../crypto/primitives.hpp"

#include <openssl/crypto.h>

#include <stdexcept>

namespace pqoidc {

Certificate::Certificate(std::string subject,
                         KemAlgorithm kem_algorithm,
                         SigAlgorithm sig_algorithm,
                         Bytes kem_public_key,
                         Bytes sig_public_key,
                         std::optional<Bytes> signature)
    : subject_(std::move(subject)),
      kem_algorithm_(kem_algorithm),
      sig_algorithm_(sig_algorithm),
      kem_public_key_(std::move(kem_public_key)),
      sig_public_key_(std::move(sig_public_key)),
      signature_(std::move(signature)) {}

Bytes Certificate::tbs_data() const {
    const std::string tbs = subject_ + "|" + to_hex(kem_public_key_) + "|" + to_hex(sig_public_key_);
    return Bytes(tbs.begin(), tbs.end());
}

void Certificate::sign(const SignatureProvider &signer, const Bytes &sig_secret_key) {
    if (signer.algorithm() != sig_algorithm_) {
        throw std::invalid_argument("signer algorithm does not match certificate");
    }
    signature_ = signer.sign(sig_secret_key, tbs_data());
}

bool Certificate::verify(const SignatureProvider &verifier) const {
    if (!signature_) {
        return false;
    }
    if (verifier.algorithm() != sig_algorithm_) {
        return false;
    }
    return verifier.verify(sig_public_key_, tbs_data(), *signature_);
}

bool Certificate::verify() const {
    if (!signature_) {
        return false;
    }
    auto verifier = make_signature_provider(sig_algorithm_);
    return verify(*verifier);
}

// kem_alg:u8, sig_alg:u8, subject, kem_pk, sig_pk, has_signature:u8, [signature]
Bytes Certificate::to_bytes() const {
    ByteWriter w;
    w.put_u8(static_cast<std::uint8_t>(kem_algorithm_));
    w.put_u8(static_cast<std::uint8_t>(sig_algorithm_));
    w.put_field(subject_);
    w.put_field(kem_public_key_);
    w.put_field(sig_public_key_);
    w.put_u8(signature_ ? 1 : 0);
    if (signature_) {
        w.put_field(*signature_);
    }
    return w.take();
}

Certificate Certificate::from_bytes(const Bytes &data) {
    try {
        ByteReader r(data);
        KemAlgorithm kem = kem_algorithm_from_id(r.get_u8());
        SigAlgorithm sig = sig_algorithm_from_id(r.get_u8());
        std::string subject = r.get_string();
        Bytes kem_pk = r.get_field();
        Bytes sig_pk = r.get_field();
        std::optional<Bytes> signature;
        std::uint8_t has_sig = r.get_u8();
        if (has_sig == 1) {
            signature = r.get_field();
        } else if (has_sig != 0) {
            throw ProtocolError("invalid signature presence flag");
        }
        r.expect_end();
        return Certificate(std::move(subject), kem, sig, std::move(kem_pk),
                           std::move(sig_pk), std::move(signature));
    } catch (const ProtocolError &e) {
        throw CertificateError(std::string("malformed certificate: ") + e.what());
    } catch (const std::invalid_argument &e) {
        throw CertificateError(std::string("malformed certificate: ") + e.what());
    }
}

std::string Certificate::to_json() const {
    JsonObject obj;
    obj["subject"] = subject_;
    obj["kem_alg"] = kem_algorithm_name(kem_algorithm_);
    obj["sig_alg"] = sig_algorithm_name(sig_algorithm_);
    obj["kem_pk"] = to_hex(kem_public_key_);
    obj["sig_pk"] = to_hex(sig_public_key_);
    if (signature_) {
        obj["signature"] = to_hex(*signature_);
    }
    return json_encode(obj);
}

Certificate Certificate::from_json(const std::string &json) {
    try {
        JsonObject obj = json_decode_object(json);
        auto subject = json_get_string(obj, "subject");
        auto kem_alg = json_get_string(obj, "kem_alg");
        auto sig_alg = json_get_string(obj, "sig_alg");
        auto kem_pk = json_get_string(obj, "kem_pk");
        auto sig_pk = json_get_string(obj, "sig_pk");
        if (!subject || !kem_alg || !sig_alg || !kem_pk || !sig_pk) {
            throw CertificateError("certificate is missing a required field");
        }
        std::optional<Bytes> signature;
        if (auto sig_hex = json_get_string(obj, "signature")) {
            signature = from_hex(*sig_hex);
        }
        return Certificate(*subject,
                           kem_algorithm_from_name(*kem_alg),
                           sig_algorithm_from_name(*sig_alg),
                           from_hex(*kem_pk),
                           from_hex(*sig_pk),
                           std::move(signature));
    } catch (const std::invalid_argument &e) {
        // JsonError, bad hex and unknown algorithm names all land here.
        throw CertificateError(std::string("malformed certificate: ") + e.what());
    }
}

Certificate issue_server_certificate(const std::string &subject, const CryptoSuite &suite) {
    if (!suite.kem || !suite.sig) {
        throw std::invalid_argument("CryptoSuite missing KEM or signature provider");
    }

    KemKeyPair kem_kp = suite.kem->generate_keypair();
    SigKeyPair sig_kp = suite.sig->generate_keypair();

    Certificate cert(subject, suite.kem->algorithm(), suite.sig->algorithm(),
                     kem_kp.public_key, sig_kp.public_key);
    cert.sign(*suite.sig, sig_kp.secret_key);

    OPENSSL_cleanse(sig_kp.secret_key.data(), sig_kp.secret_key.size());
    OPENSSL_cleanse(kem_kp.secret_key.data(), kem_kp.secret_key.size());
    return cert;
}

} // namespace pqoidc
