#include "server.hpp"
#include "url.hpp"

#include "../crypto/primitives.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace pqoidc {

namespace {

std::vector<std::string> split_scope(const std::string &scope) {
    std::vector<std::string> out;
    std::istringstream in(scope);
    std::string item;
    while (in >> item) {
        out.push_back(item);
    }
    return out;
}

std::string join_scope(const std::vector<std::string> &scopes) {
    std::string out;
    for (const auto &s : scopes) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += s;
    }
    return out;
}

bool contains(const std::vector<std::string> &list, const std::string &item) {
    return std::find(list.begin(), list.end(), item) != list.end();
}

// Requested scopes the client may have, in request order, without repeats.
std::vector<std::string> grant_scopes(const std::vector<std::string> &requested,
                                      const std::vector<std::string> &allowed) {
    std::vector<std::string> granted;
    for (const auto &s : requested) {
        if (contains(allowed, s) && !contains(granted, s)) {
            granted.push_back(s);
        }
    }
    return granted;
}

const char *error_description(OAuthError error) {
    switch (error) {
    case OAuthError::UnsupportedResponseType: return "response type not supported for this client";
    case OAuthError::InvalidScope: return "scope must include openid";
    default: return "request rejected";
    }
}

std::string json_string_array(const std::vector<std::string> &items) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i != 0) {
            out.push_back(',');
        }
        out += json_quote(items[i]);
    }
    out.push_back(']');
    return out;
}

JsonObject user_claims(const User &user, const std::vector<std::string> &scopes) {
    JsonObject claims;
    if (contains(scopes, "profile")) {
        claims["name"] = user.name;
        claims["given_name"] = user.given_name;
        claims["family_name"] = user.family_name;
    }
    if (contains(scopes, "email")) {
        claims["email"] = user.email;
        claims["email_verified"] = true;
    }
    return claims;
}

} // namespace

const char *oauth_error_code(OAuthError error) {
    switch (error) {
    case OAuthError::InvalidClient: return "invalid_client";
    case OAuthError::InvalidRedirectUri: return "invalid_redirect_uri";
    case OAuthError::UnsupportedResponseType: return "unsupported_response_type";
    case OAuthError::InvalidScope: return "invalid_scope";
    case OAuthError::UnsupportedGrantType: return "unsupported_grant_type";
    case OAuthError::InvalidGrant: return "invalid_grant";
    case OAuthError::InvalidToken: return "invalid_token";
    case OAuthError::AccessDenied: return "access_denied";
    }
    return "server_error";
}

std::string TokenBundle::to_json() const {
    JsonObject obj;
    obj["access_token"] = access_token;
    obj["token_type"] = token_type;
    obj["expires_in"] = expires_in;
    obj["id_token"] = id_token;
    obj["scope"] = scope;
    return json_encode(obj);
}

AuthorizationServer::AuthorizationServer(ServerSettings settings,
                                         std::shared_ptr<const TokenCodec> codec,
                                         std::shared_ptr<AuthorizationStore> store,
                                         const Clock &clock,
                                         const AuditLogger *audit)
    : settings_(std::move(settings)),
      codec_(std::move(codec)),
      store_(std::move(store)),
      clock_(&clock),
      audit_(audit) {
    if (!codec_ || !codec_->can_sign()) {
        throw std::invalid_argument("authorization server requires a signing token codec");
    }
    if (!store_) {
        throw std::invalid_argument("authorization server requires a store");
    }
    if (settings_.code_lifetime <= 0 || settings_.token_lifetime <= 0) {
        throw std::invalid_argument("code and token lifetimes must be positive");
    }
    if (settings_.code_lifetime > kMaxLifetimeSeconds ||
        settings_.token_lifetime > kMaxLifetimeSeconds) {
        throw std::invalid_argument("code and token lifetimes are capped at one year");
    }
}

void AuthorizationServer::audit(const std::string &event, const JsonObject &payload) const {
    if (audit_) {
        audit_->log_event(event, payload);
    }
}

void AuthorizationServer::register_user(User user) {
    store_->add_user(std::move(user));
}

void AuthorizationServer::register_client(Client client) {
    store_->add_client(std::move(client));
}

std::optional<std::string> AuthorizationServer::authenticate(const std::string &username,
                                                             const std::string &password) const {
    auto user = store_->find_user_by_username(username);
    if (!user || !constant_time_equal(user->password, password)) {
        audit("login_failed", JsonObject{{"username", username}});
        return std::nullopt;
    }
    audit("login_succeeded", JsonObject{{"username", username}, {"user_id", user->user_id}});
    return user->user_id;
}

std::string AuthorizationServer::create_session(const std::string &user_id) {
    return store_->create_session(user_id, clock_->now());
}

std::optional<User> AuthorizationServer::user_from_session(const std::string &session_id) const {
    auto session = store_->find_session(session_id);
    if (!session) {
        return std::nullopt;
    }
    return store_->find_user_by_id(session->user_id);
}

AuthorizationResponse AuthorizationServer::handle_authorization_request(const AuthorizationRequest &req) {
    AuthorizationResponse resp;

    auto reject = [&](OAuthError error) {
        audit("authorization_denied", JsonObject{{"client_id", req.client_id},
                                                 {"error", oauth_error_code(error)}});
        resp.outcome = AuthorizationOutcome::Rejected;
        resp.error = error;
        return resp;
    };

    auto redirect_error = [&](OAuthError error) {
        QueryParams params{{"error", oauth_error_code(error)},
                           {"error_description", error_description(error)}};
        if (req.state) {
            params.emplace_back("state", *req.state);
        }
        audit("authorization_denied", JsonObject{{"client_id", req.client_id},
                                                 {"error", oauth_error_code(error)}});
        resp.outcome = AuthorizationOutcome::Redirect;
        resp.redirect_to = append_query(req.redirect_uri, params);
        resp.error = error;
        return resp;
    };

    auto client = store_->find_client(req.client_id);
    if (!client) {
        return reject(OAuthError::InvalidClient);
    }

    // The response_type check precedes the redirect_uri check, so this error
    // redirect goes to the URI as given.
    if (client->response_types.count(req.response_type) == 0) {
        return redirect_error(OAuthError::UnsupportedResponseType);
    }

    if (client->redirect_uris.count(req.redirect_uri) == 0) {
        return reject(OAuthError::InvalidRedirectUri);
    }

    const std::vector<std::string> requested = split_scope(req.scope);
    if (!contains(requested, "openid")) {
        return redirect_error(OAuthError::InvalidScope);
    }

    std::optional<LoginSession> session;
    if (req.session_id) {
        session = store_->find_session(*req.session_id);
    }
    if (!session || !store_->find_user_by_id(session->user_id)) {
        resp.outcome = AuthorizationOutcome::NeedsLogin;
        return resp;
    }

    AuthorizationCode record;
    record.client_id = req.client_id;
    record.user_id = session->user_id;
    record.redirect_uri = req.redirect_uri;
    record.scopes = grant_scopes(requested, client->scopes);
    record.nonce = req.nonce;
    record.auth_time = session->auth_time;
    record.expires_at = clock_->now() + settings_.code_lifetime;
    const std::string code = store_->insert_code(std::move(record));

    audit("code_issued", JsonObject{{"client_id", req.client_id}, {"user_id", session->user_id}});

    QueryParams params{{"code", code}};
    if (req.state) {
        params.emplace_back("state", *req.state);
    }
    resp.outcome = AuthorizationOutcome::Redirect;
    resp.redirect_to = append_query(req.redirect_uri, params);
    return resp;
}

TokenResponse AuthorizationServer::handle_token_request(const TokenRequest &req) {
    TokenResponse resp;

    auto deny = [&](OAuthError error, const char *reason) {
        audit("token_denied", JsonObject{{"client_id", req.client_id},
                                         {"error", oauth_error_code(error)},
                                         {"reason", reason}});
        resp.error = error;
        return resp;
    };

    auto client = store_->find_client(req.client_id);
    if (!client || !constant_time_equal(client->client_secret, req.client_secret)) {
        return deny(OAuthError::InvalidClient, "client_authentication");
    }

    if (client->grant_types.count(req.grant_type) == 0) {
        return deny(OAuthError::UnsupportedGrantType, "grant_type");
    }

    const std::int64_t now = clock_->now();
    RedeemResult redeemed = store_->redeem_code(req.code, req.client_id, req.redirect_uri, now);
    if (redeemed.status != RedeemStatus::Ok) {
        return deny(OAuthError::InvalidGrant, redeem_status_name(redeemed.status));
    }
    const AuthorizationCode &code = *redeemed.code;

    auto user = store_->find_user_by_id(code.user_id);
    if (!user) {
        return deny(OAuthError::InvalidGrant, "unknown_user");
    }

    TokenBundle bundle;
    bundle.id_token = codec_->create_id_token(user->user_id, client->client_id, code.nonce,
                                              code.auth_time, settings_.token_lifetime,
                                              user_claims(*user, code.scopes));

    AccessTokenRecord record;
    record.user_id = user->user_id;
    record.client_id = client->client_id;
    record.scopes = code.scopes;
    record.expires_at = now + settings_.token_lifetime;
    bundle.access_token = store_->insert_access_token(std::move(record));
    bundle.expires_in = settings_.token_lifetime;
    bundle.scope = join_scope(code.scopes);

    audit("token_issued", JsonObject{{"client_id", client->client_id},
                                     {"user_id", user->user_id},
                                     {"scope", bundle.scope}});
    resp.tokens = std::move(bundle);
    return resp;
}

UserInfoResponse AuthorizationServer::handle_userinfo_request(const std::string &access_token) const {
    UserInfoResponse resp;

    auto record = store_->find_access_token(access_token);
    if (!record || clock_->now() > record->expires_at) {
        resp.error = OAuthError::InvalidToken;
        return resp;
    }
    auto user = store_->find_user_by_id(record->user_id);
    if (!user) {
        resp.error = OAuthError::InvalidToken;
        return resp;
    }

    JsonObject claims = user_claims(*user, record->scopes);
    claims["sub"] = user->user_id;
    resp.claims = std::move(claims);
    return resp;
}

std::string AuthorizationServer::discovery_document() const {
    const std::string &iss = settings_.issuer;
    std::ostringstream oss;
    oss << "{"
        << "\"issuer\":" << json_quote(iss) << ","
        << "\"authorization_endpoint\":" << json_quote(iss + "/authorize") << ","
        << "\"token_endpoint\":" << json_quote(iss + "/token") << ","
        << "\"userinfo_endpoint\":" << json_quote(iss + "/userinfo") << ","
        << "\"jwks_uri\":" << json_quote(iss + "/jwks") << ","
        << "\"scopes_supported\":" << json_string_array({"openid", "profile", "email"}) << ","
        << "\"response_types_supported\":" << json_string_array({"code"}) << ","
        << "\"grant_types_supported\":" << json_string_array({"authorization_code"}) << ","
        << "\"subject_types_supported\":" << json_string_array({"public"}) << ","
        << "\"id_token_signing_alg_values_supported\":"
        << json_string_array({sig_algorithm_name(codec_->algorithm())}) << ","
        << "\"token_endpoint_auth_methods_supported\":" << json_string_array({"client_secret_post"}) << ","
        << "\"claims_supported\":"
        << json_string_array({"sub", "iss", "aud", "exp", "iat", "nbf", "auth_time", "nonce",
                              "name", "given_name", "family_name", "email", "email_verified"})
        << "}";
    return oss.str();
}

std::string AuthorizationServer::jwks() const {
    const Bytes &pk = codec_->public_key();
    Bytes digest = sha256(pk);
    digest.resize(8);

    JsonObject key;
    key["kty"] = "PQ";
    key["use"] = "sig";
    key["alg"] = sig_algorithm_name(codec_->algorithm());
    key["kid"] = to_hex(digest);
    key["x"] = base64url_encode(pk);
    return "{\"keys\":[" + json_encode(key) + "]}";
}

} // namespace pqoidc
