#include "relying_party.hpp"
#include "url.hpp"

#include "../crypto/primitives.hpp"

#include <stdexcept>
#include <utility>

namespace pqoidc {

RelyingParty::RelyingParty(std::string client_id,
                           std::string client_secret,
                           std::string issuer,
                           std::string redirect_uri,
                           std::shared_ptr<const TokenCodec> verifier,
                           std::vector<std::string> scopes)
    : client_id_(std::move(client_id)),
      client_secret_(std::move(client_secret)),
      issuer_(std::move(issuer)),
      redirect_uri_(std::move(redirect_uri)),
      verifier_(std::move(verifier)),
      scopes_(std::move(scopes)) {
    while (!issuer_.empty() && issuer_.back() == '/') {
        issuer_.pop_back();
    }
    if (!verifier_) {
        throw std::invalid_argument("relying party requires a token verifier");
    }
}

std::string RelyingParty::authorization_url() {
    std::string state = random_token();
    std::string nonce = random_token();
    pending_[state] = nonce;

    std::string scope;
    for (const auto &s : scopes_) {
        if (!scope.empty()) {
            scope.push_back(' ');
        }
        scope += s;
    }

    return append_query(issuer_ + "/authorize", {{"response_type", "code"},
                                                 {"client_id", client_id_},
                                                 {"redirect_uri", redirect_uri_},
                                                 {"scope", scope},
                                                 {"state", state},
                                                 {"nonce", nonce}});
}

CallbackParams RelyingParty::validate_callback(const std::string &callback_url) const {
    const auto params = parse_query(callback_url);

    auto error = params.find("error");
    if (error != params.end()) {
        std::string msg = "authorization error: " + error->second;
        auto desc = params.find("error_description");
        if (desc != params.end() && !desc->second.empty()) {
            msg += " - " + desc->second;
        }
        throw std::runtime_error(msg);
    }

    auto code = params.find("code");
    if (code == params.end() || code->second.empty()) {
        throw std::runtime_error("authorization code missing from callback");
    }
    auto state = params.find("state");
    if (state == params.end() || state->second.empty()) {
        throw std::runtime_error("state missing from callback");
    }
    if (pending_.count(state->second) == 0) {
        throw std::runtime_error("unknown state in callback");
    }
    return CallbackParams{code->second, state->second};
}

PreparedTokenRequest RelyingParty::token_request(const std::string &code, const std::string &state) {
    auto it = pending_.find(state);
    if (it == pending_.end()) {
        throw std::runtime_error("unknown state");
    }

    PreparedTokenRequest prepared;
    prepared.request.grant_type = "authorization_code";
    prepared.request.code = code;
    prepared.request.redirect_uri = redirect_uri_;
    prepared.request.client_id = client_id_;
    prepared.request.client_secret = client_secret_;
    prepared.expected_nonce = it->second;
    pending_.erase(it);
    return prepared;
}

std::string RelyingParty::logout_url(const std::optional<std::string> &post_logout_redirect_uri,
                                     const std::optional<std::string> &state) const {
    QueryParams params;
    if (post_logout_redirect_uri && !post_logout_redirect_uri->empty()) {
        params.emplace_back("post_logout_redirect_uri", *post_logout_redirect_uri);
    }
    if (state && !state->empty()) {
        params.emplace_back("state", *state);
    }
    return append_query(issuer_ + "/logout", params);
}

JsonObject RelyingParty::verify_id_token(const std::string &id_token,
                                         const std::optional<std::string> &expected_nonce) const {
    VerifyOptions opts;
    opts.audience = client_id_;
    opts.issuer = issuer_;
    JsonObject claims = verifier_->verify(id_token, opts);

    if (expected_nonce) {
        auto nonce = json_get_string(claims, "nonce");
        if (!nonce || !constant_time_equal(*nonce, *expected_nonce)) {
            throw std::runtime_error("id token nonce mismatch");
        }
    }
    return claims;
}

} // namespace pqoidc
