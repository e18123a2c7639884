#pragma once

#include "message.hpp"

#include "../crypto/hkdf.hpp"
#include "../crypto/interfaces.hpp"

#include <string>

namespace pqoidc {

enum class HandshakeState {
    Start,
    ClientHelloSent,        // client
    ClientHelloReceived,    // server
    ServerHelloSent,        // server
    ServerHelloReceived,    // client
    ServerFinishedSent,     // server
    ServerFinishedReceived, // client
    HandshakeComplete,
    Aborted
};

std::string handshake_state_name(HandshakeState state);

// Per-connection key state. Either every field is populated (after
// derive_keys) or none is. Secrets are wiped on destruction.
class Session {
public:
    Session() = default;
    Session(const Session &) = default;
    Session &operator=(const Session &) = default;
    ~Session();

    void derive_keys(const Bytes &shared_secret,
                     const Bytes &client_nonce,
                     const Bytes &server_nonce,
                     const HkdfProvider &hkdf);

    bool is_ready() const { return ready_; }

    const Bytes &client_nonce() const { return client_nonce_; }
    const Bytes &server_nonce() const { return server_nonce_; }
    const Bytes &shared_secret() const { return shared_secret_; }
    const Bytes &encryption_key() const { return keys_.encryption_key; }
    const Bytes &mac_key() const { return keys_.mac_key; }
    const Bytes &iv() const { return keys_.iv; }

    // SHA-256(client_nonce || server_nonce || shared_secret). Throws StateError
    // before keys are derived.
    Bytes transcript_hash() const;

    void clear();

private:
    Bytes client_nonce_;
    Bytes server_nonce_;
    Bytes shared_secret_;
    SessionKeys keys_;
    bool ready_{false};
};

// Builds a CLIENT_FINISHED or SERVER_FINISHED message carrying the session's
// transcript hash. Throws StateError when the session has no keys.
Message create_finished(MessageType type, const Session &session);

// Constant-time check of a received Finished payload against the session.
bool verify_finished(const Message &msg, const Session &session);

} // namespace pqoidc
