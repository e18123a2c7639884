#include "session.hpp"
#include "errors.hpp"

#include "../crypto/primitives.hpp"

#include <openssl/crypto.h>

#include <stdexcept>

namespace pqoidc {

namespace {

void wipe(Bytes &b) {
    if (!b.empty()) {
        OPENSSL_cleanse(b.data(), b.size());
    }
    b.clear();
}

} // namespace

std::string handshake_state_name(HandshakeState state) {
    switch (state) {
    case HandshakeState::Start: return "START";
    case HandshakeState::ClientHelloSent: return "CLIENT_HELLO_SENT";
    case HandshakeState::ClientHelloReceived: return "CLIENT_HELLO_RECEIVED";
    case HandshakeState::ServerHelloSent: return "SERVER_HELLO_SENT";
    case HandshakeState::ServerHelloReceived: return "SERVER_HELLO_RECEIVED";
    case HandshakeState::ServerFinishedSent: return "SERVER_FINISHED_SENT";
    case HandshakeState::ServerFinishedReceived: return "SERVER_FINISHED_RECEIVED";
    case HandshakeState::HandshakeComplete: return "HANDSHAKE_COMPLETE";
    case HandshakeState::Aborted: return "ABORTED";
    }
    return "UNKNOWN";
}

Session::~Session() {
    clear();
}

void Session::derive_keys(const Bytes &shared_secret,
                          const Bytes &client_nonce,
                          const Bytes &server_nonce,
                          const HkdfProvider &hkdf) {
    // Derive first so a failure leaves the session untouched.
    SessionKeys keys = derive_session_keys(shared_secret, client_nonce, server_nonce, hkdf);
    Bytes secret = shared_secret;
    Bytes cn = client_nonce;
    Bytes sn = server_nonce;

    clear();
    shared_secret_ = std::move(secret);
    client_nonce_ = std::move(cn);
    server_nonce_ = std::move(sn);
    keys_ = std::move(keys);
    ready_ = true;
}

Bytes Session::transcript_hash() const {
    if (!ready_) {
        throw StateError("session keys not derived");
    }
    Bytes data;
    data.reserve(client_nonce_.size() + server_nonce_.size() + shared_secret_.size());
    data.insert(data.end(), client_nonce_.begin(), client_nonce_.end());
    data.insert(data.end(), server_nonce_.begin(), server_nonce_.end());
    data.insert(data.end(), shared_secret_.begin(), shared_secret_.end());
    Bytes digest = sha256(data);
    OPENSSL_cleanse(data.data(), data.size());
    return digest;
}

void Session::clear() {
    wipe(shared_secret_);
    wipe(keys_.encryption_key);
    wipe(keys_.mac_key);
    wipe(keys_.iv);
    client_nonce_.clear();
    server_nonce_.clear();
    ready_ = false;
}

Message create_finished(MessageType type, const Session &session) {
    if (type != MessageType::ClientFinished && type != MessageType::ServerFinished) {
        throw std::invalid_argument("not a Finished message type");
    }
    if (!session.is_ready()) {
        throw StateError("session not ready");
    }
    Finished f{session.transcript_hash()};
    return Message{type, f.encode()};
}

bool verify_finished(const Message &msg, const Session &session) {
    Finished f = Finished::decode(msg.payload);
    return constant_time_equal(f.handshake_hash, session.transcript_hash());
}

} // namespace pqoidc
