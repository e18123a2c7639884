#pragma once

#include <stdexcept>
#include <string>

namespace pqoidc {

// All handshake failures are fatal to the connection; nothing is retried.
class HandshakeError : public std::runtime_error {
public:
    explicit HandshakeError(const std::string &msg) : std::runtime_error(msg) {}
};

// Wrong message type, out-of-order message, malformed payload, peer alert.
class ProtocolError : public HandshakeError {
public:
    explicit ProtocolError(const std::string &msg) : HandshakeError(msg) {}
};

// Server certificate failed to parse or verify.
class CertificateError : public HandshakeError {
public:
    explicit CertificateError(const std::string &msg) : HandshakeError(msg) {}
};

// Operation invoked before its prerequisite state was reached.
class StateError : public HandshakeError {
public:
    explicit StateError(const std::string &msg) : HandshakeError(msg) {}
};

} // namespace pqoidc
