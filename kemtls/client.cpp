#include "client.hpp"
#include "errors.hpp"

#include "../crypto/factories.hpp"
#include "../crypto/primitives.hpp"

#include <openssl/crypto.h>

#include <stdexcept>

namespace pqoidc {

namespace {

void check_expected_kem(KemAlgorithm own, const ClientOptions &options) {
    if (options.expected_server_kem && *options.expected_server_kem != own) {
        throw std::invalid_argument("client KEM " + kem_algorithm_name(own) +
                                    " does not match server KEM " +
                                    kem_algorithm_name(*options.expected_server_kem));
    }
}

} // namespace

KemtlsClient::KemtlsClient(KemAlgorithm kem, ClientOptions options)
    : options_(std::move(options)) {
    check_expected_kem(kem, options_);
    kem_ = make_kem_provider(kem);
    hkdf_ = make_hkdf_sha256_provider();
}

KemtlsClient::KemtlsClient(std::shared_ptr<const KemProvider> kem,
                           std::shared_ptr<const HkdfProvider> hkdf,
                           ClientOptions options)
    : kem_(std::move(kem)), hkdf_(std::move(hkdf)), options_(std::move(options)) {
    if (!kem_ || !hkdf_) {
        throw std::invalid_argument("KemtlsClient requires KEM and HKDF providers");
    }
    check_expected_kem(kem_->algorithm(), options_);
}

KemtlsClient::~KemtlsClient() {
    wipe_ephemeral();
}

Message KemtlsClient::create_client_hello() {
    if (state_ != HandshakeState::Start) {
        abort();
        throw StateError("CLIENT_HELLO already sent");
    }

    KemKeyPair kp = kem_->generate_keypair();
    ephemeral_secret_key_ = std::move(kp.secret_key);
    client_nonce_ = generate_nonce(kSessionNonceSize);

    ClientHello hello{kem_->algorithm(), kp.public_key, client_nonce_};
    state_ = HandshakeState::ClientHelloSent;
    return Message{MessageType::ClientHello, hello.encode()};
}

ServerHelloResult KemtlsClient::handle_server_hello(const Message &msg) {
    expect_state(HandshakeState::ClientHelloSent, msg);
    if (msg.type != MessageType::ServerHello) {
        fail_protocol("expected SERVER_HELLO, got " + message_type_name(msg.type));
    }

    try {
        ServerHello hello = ServerHello::decode(msg.payload);

        Bytes shared_secret = kem_->decapsulate(hello.kem_ciphertext, ephemeral_secret_key_);
        wipe_ephemeral();

        Certificate cert = Certificate::from_bytes(hello.certificate);
        if (!cert.verify()) {
            throw CertificateError("invalid server certificate signature");
        }
        if (options_.expected_subject && cert.subject() != *options_.expected_subject) {
            throw CertificateError("server certificate subject mismatch");
        }
        if (cert.kem_algorithm() != kem_->algorithm()) {
            throw ProtocolError("server certificate advertises " +
                                kem_algorithm_name(cert.kem_algorithm()));
        }

        session_.derive_keys(shared_secret, client_nonce_, hello.nonce, *hkdf_);
        server_certificate_ = cert;
        state_ = HandshakeState::ServerHelloReceived;

        return ServerHelloResult{std::move(shared_secret), hello.nonce, std::move(cert)};
    } catch (const HandshakeError &) {
        abort();
        throw;
    } catch (const std::invalid_argument &e) {
        abort();
        throw ProtocolError(e.what());
    } catch (const std::exception &) {
        abort();
        throw;
    }
}

void KemtlsClient::handle_server_finished(const Message &msg) {
    expect_state(HandshakeState::ServerHelloReceived, msg);
    if (msg.type != MessageType::ServerFinished) {
        fail_protocol("expected SERVER_FINISHED, got " + message_type_name(msg.type));
    }

    bool ok = false;
    try {
        ok = verify_finished(msg, session_);
    } catch (const HandshakeError &) {
        abort();
        throw;
    }
    if (!ok) {
        fail_protocol("SERVER_FINISHED handshake hash mismatch");
    }
    state_ = HandshakeState::ServerFinishedReceived;
}

Message KemtlsClient::create_client_finished() {
    if (!session_.is_ready()) {
        abort();
        throw StateError("session not ready");
    }
    if (state_ != HandshakeState::ServerFinishedReceived) {
        abort();
        throw StateError("SERVER_FINISHED not yet verified");
    }

    Message msg = create_finished(MessageType::ClientFinished, session_);
    state_ = HandshakeState::HandshakeComplete;
    return msg;
}

void KemtlsClient::abort() {
    state_ = HandshakeState::Aborted;
    wipe_ephemeral();
    session_.clear();
}

void KemtlsClient::fail_protocol(const std::string &msg) {
    abort();
    throw ProtocolError(msg);
}

void KemtlsClient::expect_state(HandshakeState expected, const Message &msg) {
    if (msg.type == MessageType::Alert) {
        std::string description = "malformed alert";
        try {
            description = Alert::decode(msg.payload).description;
        } catch (const ProtocolError &e) {
            description = e.what();
        }
        fail_protocol("peer alert: " + description);
    }
    if (state_ != expected) {
        fail_protocol("unexpected " + message_type_name(msg.type) + " in state " +
                      handshake_state_name(state_));
    }
}

void KemtlsClient::wipe_ephemeral() {
    if (!ephemeral_secret_key_.empty()) {
        OPENSSL_cleanse(ephemeral_secret_key_.data(), ephemeral_secret_key_.size());
        ephemeral_secret_key_.clear();
    }
}

} // namespace pqoidc
