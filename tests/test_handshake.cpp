#include <catch2/catch.hpp>
#include "test_helpers.hpp"

#include "../kemtls/errors.hpp"
#include "../kemtls/handshake.hpp"

#include <exception>
#include <stdexcept>
#include <thread>

using namespace pqoidc;
using namespace test_helpers;

namespace {

// Fails every receive with a non-handshake error.
class BrokenChannel : public MessageChannel {
public:
    void send(const Message &) override {}
    Message receive() override { throw std::runtime_error("backend failure"); }
};

KemtlsClient make_client(ClientOptions opts = {}) {
    const CryptoSuite &suite = default_suite();
    return KemtlsClient(suite.kem, suite.hkdf, opts);
}

} // namespace

TEST_CASE("full handshake derives identical sessions", "[kemtls][handshake]") {
    const CryptoSuite &suite = default_suite();
    KemtlsServer server(default_certificate(), suite);
    ClientOptions opts;
    opts.expected_subject = "CN=test-server";
    opts.expected_server_kem = KemAlgorithm::MlKem512;
    KemtlsClient client(suite.kem, suite.hkdf, opts);

    Message hello = client.create_client_hello();
    REQUIRE(hello.type == MessageType::ClientHello);
    REQUIRE(client.state() == HandshakeState::ClientHelloSent);

    ClientHelloResult ch = server.handle_client_hello(hello);
    REQUIRE(ch.client_nonce.size() == 16);
    REQUIRE(server.state() == HandshakeState::ClientHelloReceived);

    ServerHelloOutput sh = server.create_server_hello(ch.peer_public_key);
    REQUIRE(sh.kem_ciphertext.size() == suite.kem->ciphertext_size());

    ServerHelloResult result = client.handle_server_hello(sh.message);
    REQUIRE(result.shared_secret == sh.shared_secret);
    REQUIRE(result.certificate.subject() == "CN=test-server");
    REQUIRE(client.state() == HandshakeState::ServerHelloReceived);

    client.handle_server_finished(server.create_server_finished());
    server.handle_client_finished(client.create_client_finished());

    REQUIRE(client.state() == HandshakeState::HandshakeComplete);
    REQUIRE(server.state() == HandshakeState::HandshakeComplete);

    const Session &a = client.session();
    const Session &b = server.session();
    REQUIRE(a.is_ready());
    REQUIRE(b.is_ready());
    REQUIRE(a.encryption_key() == b.encryption_key());
    REQUIRE(a.mac_key() == b.mac_key());
    REQUIRE(a.iv() == b.iv());
    REQUIRE(a.transcript_hash() == b.transcript_hash());
    REQUIRE(a.client_nonce() == ch.client_nonce);
}

TEST_CASE("messages out of order abort the handshake", "[kemtls][handshake]") {
    const CryptoSuite &suite = default_suite();

    SECTION("server receives CLIENT_FINISHED first") {
        KemtlsServer server(default_certificate(), suite);
        Message bogus{MessageType::ClientFinished, Finished{Bytes(32, 0)}.encode()};
        REQUIRE_THROWS_AS(server.handle_client_hello(bogus), ProtocolError);
        REQUIRE(server.state() == HandshakeState::Aborted);
        REQUIRE_FALSE(server.session().is_ready());
    }

    SECTION("client receives SERVER_HELLO before sending CLIENT_HELLO") {
        KemtlsClient client = make_client();
        KemtlsClient other = make_client();
        KemtlsServer server(default_certificate(), suite);
        ClientHelloResult ch = server.handle_client_hello(other.create_client_hello());
        Message sh = server.create_server_hello(ch.peer_public_key).message;
        REQUIRE_THROWS_AS(client.handle_server_hello(sh), ProtocolError);
        REQUIRE(client.state() == HandshakeState::Aborted);
    }

    SECTION("client receives SERVER_FINISHED in place of SERVER_HELLO") {
        KemtlsClient client = make_client();
        client.create_client_hello();
        Message fin{MessageType::ServerFinished, Finished{Bytes(32, 0)}.encode()};
        REQUIRE_THROWS_AS(client.handle_server_hello(fin), ProtocolError);
        REQUIRE(client.state() == HandshakeState::Aborted);
    }

    SECTION("aborted engines cannot be resumed") {
        KemtlsClient client = make_client();
        client.create_client_hello();
        client.abort();
        REQUIRE_THROWS_AS(client.create_client_hello(), StateError);
    }

    SECTION("finished before keys exist") {
        KemtlsClient client = make_client();
        client.create_client_hello();
        REQUIRE_THROWS_AS(client.create_client_finished(), StateError);

        KemtlsServer server(default_certificate(), suite);
        REQUIRE_THROWS_AS(server.create_server_finished(), StateError);
        REQUIRE_THROWS_AS(create_finished(MessageType::ServerFinished, Session{}), StateError);
    }

    SECTION("peer alert") {
        KemtlsClient client = make_client();
        client.create_client_hello();
        REQUIRE_THROWS_AS(client.handle_server_hello(
                              make_alert_message(AlertCode::HandshakeFailure, "handshake_failure")),
                          ProtocolError);
    }
}

TEST_CASE("KEM mismatch fails before any secret is derived", "[kemtls][handshake]") {
    const CryptoSuite &suite = default_suite();

    SECTION("pinned server KEM differs from the client's") {
        ClientOptions opts;
        opts.expected_server_kem = KemAlgorithm::MlKem768;
        REQUIRE_THROWS_AS(KemtlsClient(suite.kem, suite.hkdf, opts), std::invalid_argument);
    }

    SECTION("server rejects a CLIENT_HELLO for another KEM") {
        KemtlsClient client(KemAlgorithm::MlKem768);
        KemtlsServer server(default_certificate(), suite);
        REQUIRE_THROWS_AS(server.handle_client_hello(client.create_client_hello()), ProtocolError);
        REQUIRE(server.state() == HandshakeState::Aborted);
        REQUIRE_FALSE(server.session().is_ready());
    }
}

TEST_CASE("client rejects bad server certificates", "[kemtls][handshake]") {
    const CryptoSuite &suite = default_suite();
    auto good = default_certificate();

    SECTION("unsigned certificate") {
        auto unsigned_cert = std::make_shared<const Certificate>(
            good->subject(), good->kem_algorithm(), good->sig_algorithm(),
            good->kem_public_key(), good->sig_public_key());
        KemtlsServer server(unsigned_cert, suite);
        KemtlsClient client = make_client();

        ClientHelloResult ch = server.handle_client_hello(client.create_client_hello());
        Message sh = server.create_server_hello(ch.peer_public_key).message;
        REQUIRE_THROWS_AS(client.handle_server_hello(sh), CertificateError);
        REQUIRE(client.state() == HandshakeState::Aborted);
        REQUIRE_FALSE(client.session().is_ready());
    }

    SECTION("subject differs from the pinned name") {
        ClientOptions opts;
        opts.expected_subject = "CN=somebody-else";
        KemtlsClient client = make_client(opts);
        KemtlsServer server(good, suite);

        ClientHelloResult ch = server.handle_client_hello(client.create_client_hello());
        Message sh = server.create_server_hello(ch.peer_public_key).message;
        REQUIRE_THROWS_AS(client.handle_server_hello(sh), CertificateError);
    }
}

TEST_CASE("tampered finished messages are rejected", "[kemtls][handshake]") {
    const CryptoSuite &suite = default_suite();
    KemtlsServer server(default_certificate(), suite);
    KemtlsClient client = make_client();

    ClientHelloResult ch = server.handle_client_hello(client.create_client_hello());
    client.handle_server_hello(server.create_server_hello(ch.peer_public_key).message);

    Message fin = server.create_server_finished();
    fin.payload.back() ^= 0x01;
    REQUIRE_THROWS_AS(client.handle_server_finished(fin), ProtocolError);
    REQUIRE(client.state() == HandshakeState::Aborted);
}

TEST_CASE("handshake drivers over an in-memory channel", "[kemtls][handshake][channel]") {
    const CryptoSuite &suite = default_suite();
    auto channels = MemoryChannel::make_pair(std::chrono::seconds(10));

    SECTION("success") {
        KemtlsServer server(default_certificate(), suite);
        KemtlsClient client = make_client();

        Session server_session;
        std::exception_ptr server_error;
        std::thread t([&] {
            try {
                server_session = perform_server_handshake(server, *channels.second);
            } catch (const std::exception &) {
                server_error = std::current_exception();
            }
        });
        Session client_session = perform_client_handshake(client, *channels.first);
        t.join();

        REQUIRE(server_error == nullptr);
        REQUIRE(client_session.encryption_key() == server_session.encryption_key());
        REQUIRE(client_session.transcript_hash() == server_session.transcript_hash());
    }

    SECTION("certificate failure is reported to the server as an alert") {
        KemtlsServer server(default_certificate(), suite);
        ClientOptions opts;
        opts.expected_subject = "CN=pinned";
        KemtlsClient client = make_client(opts);

        bool server_saw_protocol_error = false;
        std::thread t([&] {
            try {
                perform_server_handshake(server, *channels.second);
            } catch (const ProtocolError &) {
                server_saw_protocol_error = true;
            }
        });
        REQUIRE_THROWS_AS(perform_client_handshake(client, *channels.first), CertificateError);
        t.join();

        REQUIRE(server_saw_protocol_error);
        REQUIRE(server.state() == HandshakeState::Aborted);
        REQUIRE(client.state() == HandshakeState::Aborted);
    }
}

TEST_CASE("non-handshake errors abort and propagate unchanged", "[kemtls][handshake][channel]") {
    BrokenChannel channel;

    KemtlsServer server(default_certificate(), default_suite());
    REQUIRE_THROWS_AS(perform_server_handshake(server, channel), std::runtime_error);
    REQUIRE(server.state() == HandshakeState::Aborted);

    KemtlsClient client = make_client();
    REQUIRE_THROWS_WITH(perform_client_handshake(client, channel), "backend failure");
    REQUIRE(client.state() == HandshakeState::Aborted);
}
