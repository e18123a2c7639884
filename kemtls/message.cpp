#include "message.hpp"
#include "errors.hpp"
#include "wire.hpp"

#include "../crypto/hkdf.hpp"
#include "../crypto/primitives.hpp"

#include <stdexcept>

namespace pqoidc {

namespace {

bool is_known_type(std::uint8_t v) {
    switch (v) {
    case 0x01: case 0x02: case 0x03: case 0x04:
    case 0x05: case 0x06: case 0x10: case 0xFF:
        return true;
    default:
        return false;
    }
}

} // namespace

std::string message_type_name(MessageType type) {
    switch (type) {
    case MessageType::ClientHello: return "CLIENT_HELLO";
    case MessageType::ServerHello: return "SERVER_HELLO";
    case MessageType::ServerCertificate: return "SERVER_CERTIFICATE";
    case MessageType::ServerKemtlsAuth: return "SERVER_KEMTLS_AUTH";
    case MessageType::ClientFinished: return "CLIENT_FINISHED";
    case MessageType::ServerFinished: return "SERVER_FINISHED";
    case MessageType::EncryptedData: return "ENCRYPTED_DATA";
    case MessageType::Alert: return "ALERT";
    }
    return "UNKNOWN";
}

Bytes Message::serialize() const {
    if (payload.size() > kMaxPayloadSize) {
        throw std::invalid_argument("message payload exceeds maximum size");
    }
    ByteWriter w;
    w.put_u8(static_cast<std::uint8_t>(type));
    w.put_field(payload);
    return w.take();
}

std::size_t Message::frame_length(const Bytes &header) {
    if (header.size() != kMessageHeaderSize) {
        throw ProtocolError("message header must be 5 bytes");
    }
    if (!is_known_type(header[0])) {
        throw ProtocolError("unknown message type");
    }
    ByteReader r(header);
    r.get_u8();
    std::uint32_t len = r.get_u32();
    if (len > kMaxPayloadSize) {
        throw ProtocolError("message payload exceeds maximum size");
    }
    return len;
}

Message Message::deserialize(const Bytes &data) {
    if (data.size() < kMessageHeaderSize) {
        throw ProtocolError("message too short");
    }
    Bytes header(data.begin(), data.begin() + kMessageHeaderSize);
    std::size_t len = frame_length(header);
    if (data.size() < kMessageHeaderSize + len) {
        throw ProtocolError("incomplete message");
    }
    if (data.size() > kMessageHeaderSize + len) {
        throw ProtocolError("trailing bytes after message");
    }

    Message m;
    m.type = static_cast<MessageType>(data[0]);
    m.payload.assign(data.begin() + kMessageHeaderSize, data.end());
    return m;
}

Bytes ClientHello::encode() const {
    ByteWriter w;
    w.put_u8(static_cast<std::uint8_t>(kem_algorithm));
    w.put_field(kem_public_key);
    w.put_field(nonce);
    return w.take();
}

ClientHello ClientHello::decode(const Bytes &payload) {
    ByteReader r(payload);
    ClientHello h;
    try {
        h.kem_algorithm = kem_algorithm_from_id(r.get_u8());
    } catch (const std::invalid_argument &e) {
        throw ProtocolError(e.what());
    }
    h.kem_public_key = r.get_field();
    h.nonce = r.get_field();
    r.expect_end();

    if (h.nonce.size() != kSessionNonceSize) {
        throw ProtocolError("client nonce must be 16 bytes");
    }
    if (h.kem_public_key.empty()) {
        throw ProtocolError("client KEM public key is empty");
    }
    return h;
}

Bytes ServerHello::encode() const {
    ByteWriter w;
    w.put_field(kem_ciphertext);
    w.put_field(nonce);
    w.put_field(certificate);
    return w.take();
}

ServerHello ServerHello::decode(const Bytes &payload) {
    ByteReader r(payload);
    ServerHello h;
    h.kem_ciphertext = r.get_field();
    h.nonce = r.get_field();
    h.certificate = r.get_field();
    r.expect_end();

    if (h.nonce.size() != kSessionNonceSize) {
        throw ProtocolError("server nonce must be 16 bytes");
    }
    if (h.kem_ciphertext.empty()) {
        throw ProtocolError("KEM ciphertext is empty");
    }
    return h;
}

Bytes Finished::encode() const {
    ByteWriter w;
    w.put_field(handshake_hash);
    return w.take();
}

Finished Finished::decode(const Bytes &payload) {
    ByteReader r(payload);
    Finished f;
    f.handshake_hash = r.get_field();
    r.expect_end();

    if (f.handshake_hash.size() != kSha256Size) {
        throw ProtocolError("handshake hash must be 32 bytes");
    }
    return f;
}

Bytes Alert::encode() const {
    ByteWriter w;
    w.put_u8(static_cast<std::uint8_t>(code));
    w.put_field(description);
    return w.take();
}

Alert Alert::decode(const Bytes &payload) {
    ByteReader r(payload);
    Alert a;
    a.code = static_cast<AlertCode>(r.get_u8());
    a.description = r.get_string();
    r.expect_end();
    return a;
}

Message make_alert_message(AlertCode code, const std::string &description) {
    Alert a{code, description};
    return Message{MessageType::Alert, a.encode()};
}

} // namespace pqoidc
