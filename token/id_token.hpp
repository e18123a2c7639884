#pragma once

#include "../common/clock.hpp"
#include "../common/json.hpp"
#include "../crypto/algorithms.hpp"
#include "../crypto/interfaces.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace pqoidc {

enum class TokenErrorCode {
    MalformedToken,
    BadAlgorithm,
    BadSignature,
    Expired,
    NotYetValid,
    AudienceMismatch,
    IssuerMismatch
};

const char *token_error_code_name(TokenErrorCode code);

// what() is the fixed code name only.
class TokenError : public std::runtime_error {
public:
    explicit TokenError(TokenErrorCode code)
        : std::runtime_error(token_error_code_name(code)), code_(code) {}

    TokenErrorCode code() const { return code_; }

private:
    TokenErrorCode code_;
};

struct VerifyOptions {
    bool check_expiry = true;
    std::optional<std::string> audience;
    std::optional<std::string> issuer;
};

struct DecodedToken {
    JsonObject header;
    JsonObject claims;
};

// Signed assertion codec:
//   base64url(header) "." base64url(claims) "." base64url(signature)
// with header {"alg": <algorithm>, "typ": "JWT"}. The signature covers the two
// encoded segments exactly as transmitted.
class TokenCodec {
public:
    // Keys are fixed-size buffers for `provider`'s algorithm. An empty secret
    // key makes a verify-only codec.
    TokenCodec(std::shared_ptr<const SignatureProvider> provider,
               SigKeyPair keypair,
               std::string issuer,
               const Clock &clock = system_clock());

    static TokenCodec generate(SigAlgorithm alg, std::string issuer,
                               const Clock &clock = system_clock());
    static TokenCodec verifier(SigAlgorithm alg, Bytes public_key,
                               const Clock &clock = system_clock());

    SigAlgorithm algorithm() const { return provider_->algorithm(); }
    const Bytes &public_key() const { return keypair_.public_key; }
    const std::string &issuer() const { return issuer_; }
    bool can_sign() const { return !keypair_.secret_key.empty(); }

    // Standard claims iss/sub/aud/iat/exp/nbf are set here; `claims` and
    // `extra_claims` may not contain them. ttl must be positive and now + ttl
    // must fit in an int64.
    std::string create(const JsonObject &claims,
                       const std::string &issuer,
                       const std::string &subject,
                       const std::string &audience,
                       std::int64_t ttl,
                       const JsonObject &extra_claims = {}) const;

    // OIDC ID token: adds auth_time (defaults to now) and nonce when given.
    std::string create_id_token(const std::string &user_id,
                                const std::string &client_id,
                                const std::optional<std::string> &nonce,
                                std::optional<std::int64_t> auth_time,
                                std::int64_t ttl,
                                const JsonObject &extra_claims = {}) const;

    // Checks run in a fixed order: malformed, algorithm, signature, temporal,
    // audience, issuer. Throws TokenError with the first failure.
    JsonObject verify(const std::string &token, const VerifyOptions &options = {}) const;

    // Same, with an explicit issuer public key in place of the codec's own.
    // The key must belong to the codec's algorithm; a token naming any other
    // algorithm fails with BadAlgorithm.
    JsonObject verify(const std::string &token, const Bytes &public_key,
                      const VerifyOptions &options) const;

private:
    std::shared_ptr<const SignatureProvider> provider_;
    SigKeyPair keypair_;
    std::string issuer_;
    const Clock *clock_;
};

// Inspection only; performs no signature or claim checks.
DecodedToken decode_unverified(const std::string &token);

} // namespace pqoidc
