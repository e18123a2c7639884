#pragma once

#include "server.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pqoidc {

struct CallbackParams {
    std::string code;
    std::string state;
};

struct PreparedTokenRequest {
    TokenRequest request;
    std::string expected_nonce;
};

// Client side of the code flow. Holds pending state/nonce pairs between
// authorization_url() and token_request(); not thread safe.
class RelyingParty {
public:
    RelyingParty(std::string client_id,
                 std::string client_secret,
                 std::string issuer,
                 std::string redirect_uri,
                 std::shared_ptr<const TokenCodec> verifier,
                 std::vector<std::string> scopes = {"openid", "profile", "email"});

    // Generates and remembers a fresh state and nonce.
    std::string authorization_url();

    // Throws std::runtime_error for an error redirect, a missing code or
    // state, or a state this client never issued.
    CallbackParams validate_callback(const std::string &callback_url) const;

    // Consumes the pending state.
    PreparedTokenRequest token_request(const std::string &code, const std::string &state);

    // Signature, expiry, audience and issuer via the token codec, then nonce.
    // TokenError propagates; a nonce mismatch is std::runtime_error.
    JsonObject verify_id_token(const std::string &id_token,
                               const std::optional<std::string> &expected_nonce) const;

    // issuer + "/logout", with post_logout_redirect_uri and state when given.
    std::string logout_url(const std::optional<std::string> &post_logout_redirect_uri = std::nullopt,
                           const std::optional<std::string> &state = std::nullopt) const;

    const std::string &client_id() const { return client_id_; }
    std::size_t pending_count() const { return pending_.size(); }

private:
    std::string client_id_;
    std::string client_secret_;
    std::string issuer_;
    std::string redirect_uri_;
    std::shared_ptr<const TokenCodec> verifier_;
    std::vector<std::string> scopes_;
    std::map<std::string, std::string> pending_; // state -> nonce
};

} // namespace pqoidc
