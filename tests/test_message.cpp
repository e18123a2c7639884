#include <catch2/catch.hpp>

#include "../kemtls/errors.hpp"
#include "../kemtls/message.hpp"

using namespace pqoidc;

TEST_CASE("message framing", "[kemtls][wire]") {
    Message msg{MessageType::ServerFinished, Bytes{0xaa, 0xbb, 0xcc}};
    Bytes frame = msg.serialize();
    REQUIRE(frame == Bytes({0x06, 0x00, 0x00, 0x00, 0x03, 0xaa, 0xbb, 0xcc}));

    Message back = Message::deserialize(frame);
    REQUIRE(back.type == MessageType::ServerFinished);
    REQUIRE(back.payload == msg.payload);

    REQUIRE(Message::frame_length(Bytes(frame.begin(), frame.begin() + kMessageHeaderSize)) == 3);

    SECTION("short input") {
        REQUIRE_THROWS_AS(Message::deserialize(Bytes{0x06, 0x00, 0x00}), ProtocolError);
    }
    SECTION("truncated payload") {
        frame.pop_back();
        REQUIRE_THROWS_AS(Message::deserialize(frame), ProtocolError);
    }
    SECTION("bytes after the frame") {
        frame.push_back(0x00);
        REQUIRE_THROWS_AS(Message::deserialize(frame), ProtocolError);
    }
    SECTION("unknown type byte") {
        frame[0] = 0x42;
        REQUIRE_THROWS_AS(Message::deserialize(frame), ProtocolError);
    }
    SECTION("oversized length") {
        Bytes header = {0x01, 0x7f, 0xff, 0xff, 0xff};
        REQUIRE_THROWS_AS(Message::frame_length(header), ProtocolError);
    }
}

TEST_CASE("hello payload schemas", "[kemtls][wire]") {
    ClientHello hello{KemAlgorithm::MlKem768, Bytes(1184, 0x11), Bytes(16, 0x22)};
    Bytes payload = hello.encode();

    // kem id, then u32 length before each variable field
    REQUIRE(payload[0] == 0x02);
    REQUIRE(payload.size() == 1 + 4 + 1184 + 4 + 16);

    ClientHello back = ClientHello::decode(payload);
    REQUIRE(back.kem_algorithm == KemAlgorithm::MlKem768);
    REQUIRE(back.kem_public_key == hello.kem_public_key);
    REQUIRE(back.nonce == hello.nonce);

    SECTION("trailing bytes are rejected") {
        payload.push_back(0);
        REQUIRE_THROWS_AS(ClientHello::decode(payload), ProtocolError);
    }
    SECTION("short nonce is rejected") {
        ClientHello bad{KemAlgorithm::MlKem512, Bytes(800, 1), Bytes(8, 2)};
        REQUIRE_THROWS_AS(ClientHello::decode(bad.encode()), ProtocolError);
    }
    SECTION("unknown KEM id is rejected") {
        payload[0] = 0x09;
        REQUIRE_THROWS_AS(ClientHello::decode(payload), ProtocolError);
    }
    SECTION("length prefix beyond the payload is rejected") {
        payload[1] = 0x7f;
        REQUIRE_THROWS_AS(ClientHello::decode(payload), ProtocolError);
    }
}

TEST_CASE("finished and alert payloads", "[kemtls][wire]") {
    Finished fin{Bytes(32, 0x5a)};
    REQUIRE(Finished::decode(fin.encode()).handshake_hash == fin.handshake_hash);
    REQUIRE_THROWS_AS(Finished::decode(Finished{Bytes(31, 0)}.encode()), ProtocolError);

    Message alert = make_alert_message(AlertCode::BadCertificate, "bad_certificate");
    REQUIRE(alert.type == MessageType::Alert);
    Alert decoded = Alert::decode(alert.payload);
    REQUIRE(decoded.code == AlertCode::BadCertificate);
    REQUIRE(decoded.description == "bad_certificate");
}
