#include "handshake.hpp"
#include "errors.hpp"

#include <exception>
#include <system_error>

namespace pqoidc {

namespace {

// Alert text is fixed per category; details stay in the local exception.
void send_alert(MessageChannel &channel, const HandshakeError &error) {
    AlertCode code = AlertCode::HandshakeFailure;
    const char *description = "handshake_failure";
    if (dynamic_cast<const CertificateError *>(&error)) {
        code = AlertCode::BadCertificate;
        description = "bad_certificate";
    } else if (dynamic_cast<const StateError *>(&error)) {
        code = AlertCode::InternalError;
        description = "internal_error";
    } else if (dynamic_cast<const ProtocolError *>(&error)) {
        code = AlertCode::UnexpectedMessage;
        description = "unexpected_message";
    }

    try {
        channel.send(make_alert_message(code, description));
    } catch (const std::system_error &) {
        // Peer already gone; the handshake error is what the caller sees.
    }
}

} // namespace

Session perform_client_handshake(KemtlsClient &client, MessageChannel &channel) {
    try {
        channel.send(client.create_client_hello());
        client.handle_server_hello(channel.receive());
        client.handle_server_finished(channel.receive());
        channel.send(client.create_client_finished());
    } catch (const HandshakeError &e) {
        client.abort();
        send_alert(channel, e);
        throw;
    } catch (const std::exception &) {
        client.abort();
        throw;
    }
    return client.session();
}

Session perform_server_handshake(KemtlsServer &server, MessageChannel &channel) {
    try {
        ClientHelloResult hello = server.handle_client_hello(channel.receive());
        ServerHelloOutput out = server.create_server_hello(hello.peer_public_key);
        channel.send(out.message);
        channel.send(server.create_server_finished());
        server.handle_client_finished(channel.receive());
    } catch (const HandshakeError &e) {
        server.abort();
        send_alert(channel, e);
        throw;
    } catch (const std::exception &) {
        server.abort();
        throw;
    }
    return server.session();
}

} // namespace pqoidc
