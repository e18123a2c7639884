#pragma once

#include "../crypto/algorithms.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace pqoidc {

enum class MessageType : std::uint8_t {
    ClientHello = 0x01,
    ServerHello = 0x02,
    ServerCertificate = 0x03,
    ServerKemtlsAuth = 0x04,
    ClientFinished = 0x05,
    ServerFinished = 0x06,
    EncryptedData = 0x10,
    Alert = 0xFF
};

std::string message_type_name(MessageType type);

constexpr std::size_t kMessageHeaderSize = 5;
constexpr std::size_t kMaxPayloadSize = 1u << 20;

// Wire format:
//   type    (1 byte)
//   length  (4 bytes, big-endian)
//   payload (length bytes)
struct Message {
    MessageType type;
    Bytes payload;

    Bytes serialize() const;

    // Requires exactly one complete frame; throws ProtocolError otherwise.
    static Message deserialize(const Bytes &data);

    // Payload length announced by a 5-byte header. Validates the type byte
    // and the size cap.
    static std::size_t frame_length(const Bytes &header);
};

struct ClientHello {
    KemAlgorithm kem_algorithm;
    Bytes kem_public_key;
    Bytes nonce;

    Bytes encode() const;
    static ClientHello decode(const Bytes &payload);
};

struct ServerHello {
    Bytes kem_ciphertext;
    Bytes nonce;
    Bytes certificate; // Certificate::to_bytes()

    Bytes encode() const;
    static ServerHello decode(const Bytes &payload);
};

struct Finished {
    Bytes handshake_hash;

    Bytes encode() const;
    static Finished decode(const Bytes &payload);
};

enum class AlertCode : std::uint8_t {
    UnexpectedMessage = 10,
    BadCertificate = 42,
    HandshakeFailure = 40,
    DecodeError = 50,
    InternalError = 80
};

struct Alert {
    AlertCode code;
    std::string description;

    Bytes encode() const;
    static Alert decode(const Bytes &payload);
};

Message make_alert_message(AlertCode code, const std::string &description);

} // namespace pqoidc
