#pragma once

#include "store.hpp"
#include "../audit/audit_logger.hpp"
#include "../common/clock.hpp"
#include "../token/id_token.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace pqoidc {

enum class OAuthError {
    InvalidClient,
    InvalidRedirectUri,
    UnsupportedResponseType,
    InvalidScope,
    UnsupportedGrantType,
    InvalidGrant,
    InvalidToken,
    AccessDenied
};

// RFC 6749 wire string ("invalid_client", ...).
const char *oauth_error_code(OAuthError error);

struct AuthorizationRequest {
    std::string response_type;
    std::string client_id;
    std::string redirect_uri;
    std::string scope; // space separated
    std::optional<std::string> state;
    std::optional<std::string> nonce;
    std::optional<std::string> session_id;
};

enum class AuthorizationOutcome {
    Redirect,   // redirect_to carries either a code or an error parameter
    NeedsLogin, // request is valid; collect credentials and retry
    Rejected    // never redirected; error says why
};

struct AuthorizationResponse {
    AuthorizationOutcome outcome = AuthorizationOutcome::Rejected;
    std::string redirect_to;
    std::optional<OAuthError> error;
};

struct TokenRequest {
    std::string grant_type;
    std::string code;
    std::string redirect_uri;
    std::string client_id;
    std::string client_secret;
};

struct TokenBundle {
    std::string access_token;
    std::string token_type = "Bearer";
    std::int64_t expires_in = 0;
    std::string id_token;
    std::string scope;

    std::string to_json() const;
};

struct TokenResponse {
    std::optional<TokenBundle> tokens;
    std::optional<OAuthError> error;

    bool ok() const { return tokens.has_value(); }
};

struct UserInfoResponse {
    std::optional<JsonObject> claims;
    std::optional<OAuthError> error;

    bool ok() const { return claims.has_value(); }
};

struct ServerSettings {
    std::string issuer;
    std::int64_t code_lifetime = 600;
    std::int64_t token_lifetime = 3600;
};

// OpenID Connect authorization-code flow over an explicit store. The token
// codec signs ID tokens; its algorithm is the one advertised in discovery.
class AuthorizationServer {
public:
    AuthorizationServer(ServerSettings settings,
                        std::shared_ptr<const TokenCodec> codec,
                        std::shared_ptr<AuthorizationStore> store,
                        const Clock &clock = system_clock(),
                        const AuditLogger *audit = nullptr);

    void register_user(User user);
    void register_client(Client client);

    // Returns the principal id on success.
    std::optional<std::string> authenticate(const std::string &username,
                                            const std::string &password) const;

    std::string create_session(const std::string &user_id);
    std::optional<User> user_from_session(const std::string &session_id) const;

    AuthorizationResponse handle_authorization_request(const AuthorizationRequest &req);
    TokenResponse handle_token_request(const TokenRequest &req);
    UserInfoResponse handle_userinfo_request(const std::string &access_token) const;

    // OpenID Provider metadata document.
    std::string discovery_document() const;

    // Public signing key document: {"keys":[{...}]}.
    std::string jwks() const;

    const ServerSettings &settings() const { return settings_; }
    const TokenCodec &token_codec() const { return *codec_; }
    AuthorizationStore &store() { return *store_; }

private:
    void audit(const std::string &event, const JsonObject &payload) const;

    ServerSettings settings_;
    std::shared_ptr<const TokenCodec> codec_;
    std::shared_ptr<AuthorizationStore> store_;
    const Clock *clock_;
    const AuditLogger *audit_;
};

} // namespace pqoidc
