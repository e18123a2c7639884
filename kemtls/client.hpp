#pragma once

#include "certificate.hpp"
#include "message.hpp"
#include "session.hpp"

#include "../crypto/interfaces.hpp"

#include <memory>
#include <optional>
#include <string>

namespace pqoidc {

struct ClientOptions {
    // Reject a server certificate whose subject differs.
    std::optional<std::string> expected_subject;

    // KEM the server is known to advertise. A mismatch with the client's own
    // KEM fails at construction, before any key is generated.
    std::optional<KemAlgorithm> expected_server_kem;
};

struct ServerHelloResult {
    Bytes shared_secret;
    Bytes server_nonce;
    Certificate certificate;
};

// Initiator side of the KEMTLS handshake:
//   START -> CLIENT_HELLO_SENT -> SERVER_HELLO_RECEIVED
//         -> SERVER_FINISHED_RECEIVED -> HANDSHAKE_COMPLETE
// Any error moves the engine to ABORTED; an aborted engine cannot be resumed.
// One instance per connection.
class KemtlsClient {
public:
    explicit KemtlsClient(KemAlgorithm kem, ClientOptions options = {});
    KemtlsClient(std::shared_ptr<const KemProvider> kem,
                 std::shared_ptr<const HkdfProvider> hkdf,
                 ClientOptions options = {});
    ~KemtlsClient();

    KemtlsClient(const KemtlsClient &) = delete;
    KemtlsClient &operator=(const KemtlsClient &) = delete;

    HandshakeState state() const { return state_; }
    KemAlgorithm kem_algorithm() const { return kem_->algorithm(); }

    // Generates the ephemeral KEM keypair and client nonce. The ephemeral
    // secret key never leaves this object.
    Message create_client_hello();

    // Decapsulates, verifies the embedded certificate and derives the session
    // keys. Throws ProtocolError or CertificateError.
    ServerHelloResult handle_server_hello(const Message &msg);

    // Checks the server's transcript hash. Throws ProtocolError on mismatch.
    void handle_server_finished(const Message &msg);

    Message create_client_finished();

    const Session &session() const { return session_; }
    const std::optional<Certificate> &server_certificate() const { return server_certificate_; }

    void abort();

private:
    [[noreturn]] void fail_protocol(const std::string &msg);
    void expect_state(HandshakeState expected, const Message &msg);
    void wipe_ephemeral();

    std::shared_ptr<const KemProvider> kem_;
    std::shared_ptr<const HkdfProvider> hkdf_;
    ClientOptions options_;

    HandshakeState state_{HandshakeState::Start};
    Bytes ephemeral_secret_key_;
    Bytes client_nonce_;
    Session session_;
    std::optional<Certificate> server_certificate_;
};

} // namespace pqoidc
