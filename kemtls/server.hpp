#pragma once

#include "certificate.hpp"
#include "message.hpp"
#include "session.hpp"

#include "../crypto/interfaces.hpp"

#include <memory>

namespace pqoidc {

struct ClientHelloResult {
    Bytes peer_public_key;
    Bytes client_nonce;
};

struct ServerHelloOutput {
    Message message;
    Bytes kem_ciphertext;
    Bytes shared_secret;
};

// Responder side of the KEMTLS handshake:
//   START -> CLIENT_HELLO_RECEIVED -> SERVER_HELLO_SENT
//         -> SERVER_FINISHED_SENT -> HANDSHAKE_COMPLETE
// The certificate is shared read-only across connections; everything else is
// owned by this per-connection engine.
class KemtlsServer {
public:
    KemtlsServer(std::shared_ptr<const Certificate> certificate, const CryptoSuite &suite);

    KemtlsServer(const KemtlsServer &) = delete;
    KemtlsServer &operator=(const KemtlsServer &) = delete;

    HandshakeState state() const { return state_; }
    const Certificate &certificate() const { return *certificate_; }

    // Throws ProtocolError for a wrong type, a malformed payload, or a
    // client KEM that differs from the server's. Nothing is derived on
    // failure.
    ClientHelloResult handle_client_hello(const Message &msg);

    // Encapsulates against the peer key, generates the server nonce and
    // derives the session keys.
    ServerHelloOutput create_server_hello(const Bytes &peer_public_key);

    Message create_server_finished();

    void handle_client_finished(const Message &msg);

    const Session &session() const { return session_; }

    void abort();

private:
    [[noreturn]] void fail_protocol(const std::string &msg);
    void expect_state(HandshakeState expected, const Message &msg);

    std::shared_ptr<const Certificate> certificate_;
    std::shared_ptr<const KemProvider> kem_;
    std::shared_ptr<const HkdfProvider> hkdf_;

    HandshakeState state_{HandshakeState::Start};
    Bytes client_nonce_;
    Session session_;
};

} // namespace pqoidc
