#include <catch2/catch.hpp>
#include "test_helpers.hpp"

#include "../crypto/primitives.hpp"
#include "../oidc/demo.hpp"
#include "../oidc/url.hpp"

#include <limits>
#include <map>
#include <stdexcept>

using namespace pqoidc;
using namespace test_helpers;

namespace {

const char *kIssuer = "http://localhost:5000";

std::shared_ptr<const TokenCodec> issuer_codec(const Clock &clock) {
    static const SigKeyPair kp = default_suite().sig->generate_keypair();
    return std::make_shared<const TokenCodec>(default_suite().sig, kp, kIssuer, clock);
}

AuthorizationRequest base_request() {
    AuthorizationRequest req;
    req.response_type = "code";
    req.client_id = kDemoClientId;
    req.redirect_uri = kDemoRedirectUri;
    req.scope = "openid profile email";
    req.state = "xyz";
    req.nonce = "n-0S6";
    return req;
}

TokenRequest token_request(const std::string &code) {
    TokenRequest tr;
    tr.grant_type = "authorization_code";
    tr.code = code;
    tr.redirect_uri = kDemoRedirectUri;
    tr.client_id = kDemoClientId;
    tr.client_secret = kDemoClientSecret;
    return tr;
}

struct Fixture {
    ManualClock clock;
    AuditLogger audit{""};
    std::unique_ptr<AuthorizationServer> server;
    std::string session_id;

    Fixture() {
        server = make_demo_server(ServerSettings{kIssuer, 600, 3600}, issuer_codec(clock), clock, &audit);
        auto uid = server->authenticate(kDemoUsername, kDemoPassword);
        session_id = server->create_session(*uid);
    }

    std::string issue_code(AuthorizationRequest req) {
        req.session_id = session_id;
        AuthorizationResponse resp = server->handle_authorization_request(req);
        REQUIRE(resp.outcome == AuthorizationOutcome::Redirect);
        REQUIRE_FALSE(resp.error.has_value());
        return parse_query(resp.redirect_to).at("code");
    }
};

} // namespace

TEST_CASE("authentication", "[oidc][server]") {
    Fixture f;
    REQUIRE(f.server->authenticate("alice", "password123") == std::string("user123"));
    REQUIRE_FALSE(f.server->authenticate("alice", "wrong").has_value());
    REQUIRE_FALSE(f.server->authenticate("bob", "password123").has_value());
    REQUIRE(f.server->user_from_session(f.session_id)->email == "alice@example.com");
    REQUIRE_FALSE(f.server->user_from_session("unknown").has_value());
}

TEST_CASE("server lifetimes are bounded", "[oidc][server]") {
    ManualClock clock;
    auto codec = issuer_codec(clock);
    REQUIRE_THROWS_AS(make_demo_server(ServerSettings{kIssuer, 0, 3600}, codec, clock),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(make_demo_server(ServerSettings{kIssuer, 600, kMaxLifetimeSeconds + 1}, codec, clock),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(make_demo_server(ServerSettings{kIssuer, std::numeric_limits<std::int64_t>::max(), 3600},
                                       codec, clock),
                      std::invalid_argument);
    REQUIRE_NOTHROW(make_demo_server(ServerSettings{kIssuer, 600, kMaxLifetimeSeconds}, codec, clock));
}

TEST_CASE("alice completes the code flow and the code is single use", "[oidc][server]") {
    Fixture f;
    const std::string code = f.issue_code(base_request());

    TokenResponse resp = f.server->handle_token_request(token_request(code));
    REQUIRE(resp.ok());
    const TokenBundle &tokens = *resp.tokens;
    REQUIRE(tokens.token_type == "Bearer");
    REQUIRE(tokens.expires_in == 3600);
    REQUIRE(tokens.scope == "openid profile email");
    REQUIRE_FALSE(tokens.access_token.empty());

    VerifyOptions opts;
    opts.audience = kDemoClientId;
    opts.issuer = kIssuer;
    JsonObject claims = f.server->token_codec().verify(tokens.id_token, opts);
    REQUIRE(claims.at("sub").as_string() == "user123");
    REQUIRE(claims.at("name").as_string() == "Alice Smith");
    REQUIRE(claims.at("given_name").as_string() == "Alice");
    REQUIRE(claims.at("family_name").as_string() == "Smith");
    REQUIRE(claims.at("email").as_string() == "alice@example.com");
    REQUIRE(claims.at("email_verified").as_bool());
    REQUIRE(claims.at("nonce").as_string() == "n-0S6");
    REQUIRE(claims.at("auth_time").as_int() == f.clock.now());

    TokenResponse replay = f.server->handle_token_request(token_request(code));
    REQUIRE_FALSE(replay.ok());
    REQUIRE(*replay.error == OAuthError::InvalidGrant);

    JsonObject bundle = json_decode_object(tokens.to_json());
    REQUIRE(bundle.at("token_type").as_string() == "Bearer");
    REQUIRE(bundle.at("id_token").as_string() == tokens.id_token);
}

TEST_CASE("claims follow the granted scope", "[oidc][server]") {
    Fixture f;
    AuthorizationRequest req = base_request();
    req.scope = "openid openid address email";
    const std::string code = f.issue_code(req);

    TokenResponse resp = f.server->handle_token_request(token_request(code));
    REQUIRE(resp.ok());
    REQUIRE(resp.tokens->scope == "openid email");

    JsonObject claims = decode_unverified(resp.tokens->id_token).claims;
    REQUIRE(claims.count("email") == 1);
    REQUIRE(claims.count("name") == 0);
}

TEST_CASE("authorization request decision order", "[oidc][server]") {
    Fixture f;
    AuthorizationRequest req = base_request();
    req.session_id = f.session_id;

    SECTION("unknown client is rejected without a redirect") {
        req.client_id = "nobody";
        req.redirect_uri = "http://evil.test/cb";
        req.response_type = "token";
        AuthorizationResponse resp = f.server->handle_authorization_request(req);
        REQUIRE(resp.outcome == AuthorizationOutcome::Rejected);
        REQUIRE(*resp.error == OAuthError::InvalidClient);
        REQUIRE(resp.redirect_to.empty());
    }

    SECTION("unsupported response type redirects with an error") {
        req.response_type = "token";
        AuthorizationResponse resp = f.server->handle_authorization_request(req);
        REQUIRE(resp.outcome == AuthorizationOutcome::Redirect);
        REQUIRE(*resp.error == OAuthError::UnsupportedResponseType);
        auto q = parse_query(resp.redirect_to);
        REQUIRE(q.at("error") == "unsupported_response_type");
        REQUIRE(q.at("state") == "xyz");
        REQUIRE(q.count("code") == 0);
    }

    SECTION("unregistered redirect uri is rejected without a redirect") {
        req.redirect_uri = "http://evil.test/cb";
        req.scope = "profile";
        AuthorizationResponse resp = f.server->handle_authorization_request(req);
        REQUIRE(resp.outcome == AuthorizationOutcome::Rejected);
        REQUIRE(*resp.error == OAuthError::InvalidRedirectUri);
        REQUIRE(resp.redirect_to.empty());
    }

    SECTION("scope without openid redirects with invalid_scope") {
        req.scope = "profile email";
        req.state.reset();
        AuthorizationResponse resp = f.server->handle_authorization_request(req);
        REQUIRE(resp.outcome == AuthorizationOutcome::Redirect);
        auto q = parse_query(resp.redirect_to);
        REQUIRE(q.at("error") == "invalid_scope");
        REQUIRE(q.count("state") == 0);
        REQUIRE(resp.redirect_to.rfind(kDemoRedirectUri, 0) == 0);
    }

    SECTION("no session asks for a login") {
        req.session_id.reset();
        AuthorizationResponse resp = f.server->handle_authorization_request(req);
        REQUIRE(resp.outcome == AuthorizationOutcome::NeedsLogin);
        REQUIRE_FALSE(resp.error.has_value());
        REQUIRE(resp.redirect_to.empty());

        req.session_id = "forged";
        REQUIRE(f.server->handle_authorization_request(req).outcome == AuthorizationOutcome::NeedsLogin);
    }

    SECTION("valid request carries code and state") {
        AuthorizationResponse resp = f.server->handle_authorization_request(req);
        auto q = parse_query(resp.redirect_to);
        REQUIRE(q.at("state") == "xyz");
        REQUIRE(q.at("code").size() == 43);
    }
}

TEST_CASE("token request validation order", "[oidc][server]") {
    Fixture f;
    const std::string code = f.issue_code(base_request());

    SECTION("bad secret") {
        TokenRequest tr = token_request(code);
        tr.client_secret = "guess";
        tr.grant_type = "password";
        REQUIRE(*f.server->handle_token_request(tr).error == OAuthError::InvalidClient);
    }

    SECTION("grant type") {
        TokenRequest tr = token_request(code);
        tr.grant_type = "password";
        REQUIRE(*f.server->handle_token_request(tr).error == OAuthError::UnsupportedGrantType);
    }

    SECTION("redirect mismatch") {
        TokenRequest tr = token_request(code);
        tr.redirect_uri = "http://localhost:8080/other";
        REQUIRE(*f.server->handle_token_request(tr).error == OAuthError::InvalidGrant);
        // The failed attempt did not consume the code.
        REQUIRE(f.server->handle_token_request(token_request(code)).ok());
    }

    SECTION("expired code") {
        f.clock.advance(601);
        REQUIRE(*f.server->handle_token_request(token_request(code)).error == OAuthError::InvalidGrant);
    }

    SECTION("unknown code") {
        REQUIRE(*f.server->handle_token_request(token_request("bogus")).error == OAuthError::InvalidGrant);
    }
}

TEST_CASE("userinfo is gated by access token and scope", "[oidc][server]") {
    Fixture f;
    AuthorizationRequest req = base_request();
    req.scope = "openid profile";
    TokenResponse tokens = f.server->handle_token_request(token_request(f.issue_code(req)));
    REQUIRE(tokens.ok());

    UserInfoResponse info = f.server->handle_userinfo_request(tokens.tokens->access_token);
    REQUIRE(info.ok());
    REQUIRE(info.claims->at("sub").as_string() == "user123");
    REQUIRE(info.claims->at("name").as_string() == "Alice Smith");
    REQUIRE(info.claims->count("email") == 0);

    REQUIRE(*f.server->handle_userinfo_request("bogus").error == OAuthError::InvalidToken);

    f.clock.advance(3601);
    REQUIRE(*f.server->handle_userinfo_request(tokens.tokens->access_token).error ==
            OAuthError::InvalidToken);
}

TEST_CASE("discovery and key documents", "[oidc][server]") {
    Fixture f;
    std::string doc = f.server->discovery_document();
    REQUIRE(doc.find("\"issuer\":\"http://localhost:5000\"") != std::string::npos);
    REQUIRE(doc.find("\"token_endpoint\":\"http://localhost:5000/token\"") != std::string::npos);
    REQUIRE(doc.find("\"id_token_signing_alg_values_supported\":[\"ML-DSA-44\"]") != std::string::npos);

    std::string jwks = f.server->jwks();
    REQUIRE(jwks.rfind("{\"keys\":[{", 0) == 0);
    REQUIRE(jwks.find(base64url_encode(f.server->token_codec().public_key())) != std::string::npos);
}

TEST_CASE("oauth error codes", "[oidc][server]") {
    REQUIRE(std::string(oauth_error_code(OAuthError::InvalidClient)) == "invalid_client");
    REQUIRE(std::string(oauth_error_code(OAuthError::InvalidRedirectUri)) == "invalid_redirect_uri");
    REQUIRE(std::string(oauth_error_code(OAuthError::UnsupportedGrantType)) == "unsupported_grant_type");
}
