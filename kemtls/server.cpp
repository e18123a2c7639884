#include "server.hpp"
#include "errors.hpp"

#include "../crypto/primitives.hpp"

#include <stdexcept>

namespace pqoidc {

KemtlsServer::KemtlsServer(std::shared_ptr<const Certificate> certificate, const CryptoSuite &suite)
    : certificate_(std::move(certificate)), kem_(suite.kem), hkdf_(suite.hkdf) {
    if (!certificate_ || !kem_ || !hkdf_) {
        throw std::invalid_argument("KemtlsServer requires a certificate, KEM and HKDF provider");
    }
    if (certificate_->kem_algorithm() != kem_->algorithm()) {
        throw std::invalid_argument("certificate KEM does not match the server's KEM provider");
    }
}

ClientHelloResult KemtlsServer::handle_client_hello(const Message &msg) {
    expect_state(HandshakeState::Start, msg);
    if (msg.type != MessageType::ClientHello) {
        fail_protocol("expected CLIENT_HELLO, got " + message_type_name(msg.type));
    }

    ClientHello hello;
    try {
        hello = ClientHello::decode(msg.payload);
    } catch (const ProtocolError &) {
        abort();
        throw;
    }

    if (hello.kem_algorithm != kem_->algorithm()) {
        fail_protocol("client KEM " + kem_algorithm_name(hello.kem_algorithm) +
                      " not supported, server uses " + kem_algorithm_name(kem_->algorithm()));
    }
    if (hello.kem_public_key.size() != kem_->public_key_size()) {
        fail_protocol("client KEM public key has wrong size");
    }

    client_nonce_ = hello.nonce;
    state_ = HandshakeState::ClientHelloReceived;
    return ClientHelloResult{std::move(hello.kem_public_key), std::move(hello.nonce)};
}

ServerHelloOutput KemtlsServer::create_server_hello(const Bytes &peer_public_key) {
    if (state_ != HandshakeState::ClientHelloReceived) {
        abort();
        throw StateError("CLIENT_HELLO not received");
    }

    try {
        Encapsulation enc = kem_->encapsulate(peer_public_key);
        Bytes server_nonce = generate_nonce(kSessionNonceSize);

        session_.derive_keys(enc.shared_secret, client_nonce_, server_nonce, *hkdf_);

        ServerHello hello{enc.ciphertext, server_nonce, certificate_->to_bytes()};
        state_ = HandshakeState::ServerHelloSent;

        return ServerHelloOutput{Message{MessageType::ServerHello, hello.encode()},
                                 std::move(enc.ciphertext),
                                 std::move(enc.shared_secret)};
    } catch (const std::invalid_argument &e) {
        abort();
        throw ProtocolError(e.what());
    } catch (const std::exception &) {
        abort();
        throw;
    }
}

Message KemtlsServer::create_server_finished() {
    if (!session_.is_ready()) {
        abort();
        throw StateError("session not ready");
    }
    if (state_ != HandshakeState::ServerHelloSent) {
        abort();
        throw StateError("SERVER_FINISHED already sent");
    }

    Message msg = create_finished(MessageType::ServerFinished, session_);
    state_ = HandshakeState::ServerFinishedSent;
    return msg;
}

void KemtlsServer::handle_client_finished(const Message &msg) {
    expect_state(HandshakeState::ServerFinishedSent, msg);
    if (msg.type != MessageType::ClientFinished) {
        fail_protocol("expected CLIENT_FINISHED, got " + message_type_name(msg.type));
    }

    bool ok = false;
    try {
        ok = verify_finished(msg, session_);
    } catch (const HandshakeError &) {
        abort();
        throw;
    }
    if (!ok) {
        fail_protocol("CLIENT_FINISHED handshake hash mismatch");
    }
    state_ = HandshakeState::HandshakeComplete;
}

void KemtlsServer::abort() {
    state_ = HandshakeState::Aborted;
    session_.clear();
}

void KemtlsServer::fail_protocol(const std::string &msg) {
    abort();
    throw ProtocolError(msg);
}

void KemtlsServer::expect_state(HandshakeState expected, const Message &msg) {
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

} // namespace pqoidc
