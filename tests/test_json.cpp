#include <catch2/catch.hpp>

#include "../common/json.hpp"

using namespace pqoidc;

TEST_CASE("json_encode sorts keys and escapes strings", "[json]") {
    JsonObject obj;
    obj["sub"] = "user123";
    obj["exp"] = std::int64_t{1700003600};
    obj["email_verified"] = true;
    obj["note"] = "line\n\"quoted\"";
    obj["missing"] = nullptr;

    REQUIRE(json_encode(obj) ==
            "{\"email_verified\":true,\"exp\":1700003600,\"missing\":null,"
            "\"note\":\"line\\n\\\"quoted\\\"\",\"sub\":\"user123\"}");
}

TEST_CASE("json_decode_object parses flat objects", "[json]") {
    JsonObject obj = json_decode_object(
        " { \"a\" : 1 , \"b\":\"x\\u00e9\\ud83d\\ude00\", \"c\":false, \"d\":null, \"e\":-42 } ");
    REQUIRE(obj.size() == 5);
    REQUIRE(obj["a"].as_int() == 1);
    REQUIRE(obj["b"].as_string() == "x\xc3\xa9\xf0\x9f\x98\x80");
    REQUIRE(obj["c"].as_bool() == false);
    REQUIRE(obj["d"].is_null());
    REQUIRE(json_get_int(obj, "e") == std::int64_t{-42});
    REQUIRE_FALSE(json_get_string(obj, "a").has_value());
    REQUIRE_THROWS_AS(obj["a"].as_string(), JsonError);

    REQUIRE(json_decode_object(json_encode(obj)) == obj);
}

TEST_CASE("json_decode_object rejects what the codec cannot represent", "[json]") {
    REQUIRE_THROWS_AS(json_decode_object("{\"a\":{\"b\":1}}"), JsonError);
    REQUIRE_THROWS_AS(json_decode_object("{\"a\":[1]}"), JsonError);
    REQUIRE_THROWS_AS(json_decode_object("{\"a\":1.5}"), JsonError);
    REQUIRE_THROWS_AS(json_decode_object("{\"a\":1,\"a\":2}"), JsonError);
    REQUIRE_THROWS_AS(json_decode_object("{\"a\":1} x"), JsonError);
    REQUIRE_THROWS_AS(json_decode_object("{\"a\":99999999999999999999}"), JsonError);
    REQUIRE_THROWS_AS(json_decode_object("{\"a\":\"\\ud83d\"}"), JsonError);
    REQUIRE_THROWS_AS(json_decode_object("{\"a\":1"), JsonError);
    REQUIRE_THROWS_AS(json_decode_object(""), JsonError);
}
