#include <catch2/catch.hpp>
#include "test_helpers.hpp"

#include "../oidc/demo.hpp"
#include "../oidc/relying_party.hpp"
#include "../oidc/url.hpp"

#include <stdexcept>

using namespace pqoidc;
using namespace test_helpers;

namespace {

const char *kIssuer = "http://localhost:5000";

const SigKeyPair &issuer_keys() {
    static const SigKeyPair kp = default_suite().sig->generate_keypair();
    return kp;
}

} // namespace

TEST_CASE("url helpers", "[oidc][url]") {
    REQUIRE(url_encode("a b&c=d/é") == "a+b%26c%3Dd%2F%C3%A9");
    REQUIRE(url_decode("a+b%26c%3dd%2F") == "a b&c=d/");
    REQUIRE_THROWS_AS(url_decode("%4"), std::invalid_argument);
    REQUIRE_THROWS_AS(url_decode("%zz"), std::invalid_argument);

    std::string url = append_query("https://rp.test/cb", {{"code", "abc"}, {"state", "x y"}});
    REQUIRE(url == "https://rp.test/cb?code=abc&state=x+y");
    REQUIRE(append_query("https://rp.test/cb?a=1", {{"b", "2"}}) == "https://rp.test/cb?a=1&b=2");

    auto q = parse_query(url + "#frag");
    REQUIRE(q.size() == 2);
    REQUIRE(q.at("state") == "x y");
    REQUIRE(parse_query("https://rp.test/cb").empty());
}

TEST_CASE("relying party drives the code flow", "[oidc][rp]") {
    ManualClock clock;
    auto codec = std::make_shared<const TokenCodec>(default_suite().sig, issuer_keys(), kIssuer, clock);
    auto server = make_demo_server(ServerSettings{kIssuer, 600, 3600}, codec, clock);
    auto verifier = std::make_shared<const TokenCodec>(
        default_suite().sig, SigKeyPair{codec->public_key(), {}}, "", clock);
    RelyingParty rp(kDemoClientId, kDemoClientSecret, std::string(kIssuer) + "/", kDemoRedirectUri,
                    verifier);

    const std::string url = rp.authorization_url();
    REQUIRE(url.rfind("http://localhost:5000/authorize?", 0) == 0);
    REQUIRE(rp.pending_count() == 1);

    auto q = parse_query(url);
    REQUIRE(q.at("response_type") == "code");
    REQUIRE(q.at("scope") == "openid profile email");

    AuthorizationRequest req;
    req.response_type = q.at("response_type");
    req.client_id = q.at("client_id");
    req.redirect_uri = q.at("redirect_uri");
    req.scope = q.at("scope");
    req.state = q.at("state");
    req.nonce = q.at("nonce");
    req.session_id = server->create_session(*server->authenticate(kDemoUsername, kDemoPassword));

    AuthorizationResponse auth = server->handle_authorization_request(req);
    CallbackParams cb = rp.validate_callback(auth.redirect_to);
    REQUIRE(cb.state == q.at("state"));

    PreparedTokenRequest prepared = rp.token_request(cb.code, cb.state);
    REQUIRE(prepared.expected_nonce == q.at("nonce"));
    REQUIRE(prepared.request.redirect_uri == kDemoRedirectUri);
    REQUIRE(rp.pending_count() == 0);
    REQUIRE_THROWS_AS(rp.token_request(cb.code, cb.state), std::runtime_error);

    TokenResponse tokens = server->handle_token_request(prepared.request);
    REQUIRE(tokens.ok());

    JsonObject claims = rp.verify_id_token(tokens.tokens->id_token, prepared.expected_nonce);
    REQUIRE(claims.at("sub").as_string() == kDemoUserId);

    SECTION("nonce mismatch") {
        REQUIRE_THROWS_AS(rp.verify_id_token(tokens.tokens->id_token, std::string("other")),
                          std::runtime_error);
    }

    SECTION("token for another audience") {
        std::string foreign = codec->create({}, kIssuer, kDemoUserId, "other-client", 60);
        try {
            rp.verify_id_token(foreign, std::nullopt);
            FAIL("foreign audience accepted");
        } catch (const TokenError &e) {
            REQUIRE(e.code() == TokenErrorCode::AudienceMismatch);
        }
    }
}

TEST_CASE("relying party callback validation", "[oidc][rp]") {
    ManualClock clock;
    auto verifier = std::make_shared<const TokenCodec>(
        default_suite().sig, SigKeyPair{issuer_keys().public_key, {}}, "", clock);
    RelyingParty rp(kDemoClientId, kDemoClientSecret, kIssuer, kDemoRedirectUri, verifier);
    const std::string state = parse_query(rp.authorization_url()).at("state");
    const std::string cb = kDemoRedirectUri;

    REQUIRE(rp.validate_callback(cb + "?code=c1&state=" + state).code == "c1");
    REQUIRE_THROWS_AS(rp.validate_callback(cb + "?error=invalid_scope&state=" + state), std::runtime_error);
    REQUIRE_THROWS_AS(rp.validate_callback(cb + "?state=" + state), std::runtime_error);
    REQUIRE_THROWS_AS(rp.validate_callback(cb + "?code=c1"), std::runtime_error);
    REQUIRE_THROWS_AS(rp.validate_callback(cb + "?code=c1&state=forged"), std::runtime_error);
}

TEST_CASE("logout url", "[oidc][rp]") {
    ManualClock clock;
    auto verifier = std::make_shared<const TokenCodec>(
        default_suite().sig, SigKeyPair{issuer_keys().public_key, {}}, "", clock);
    RelyingParty rp(kDemoClientId, kDemoClientSecret, std::string(kIssuer) + "/", kDemoRedirectUri,
                    verifier);

    REQUIRE(rp.logout_url() == "http://localhost:5000/logout");
    REQUIRE(rp.logout_url(std::string("http://localhost:8080/bye"), std::string("s 1")) ==
            "http://localhost:5000/logout?post_logout_redirect_uri=http%3A%2F%2Flocalhost%3A8080%2Fbye&state=s+1");
    REQUIRE(rp.logout_url(std::nullopt, std::string("s1")) == "http://localhost:5000/logout?state=s1");
}
