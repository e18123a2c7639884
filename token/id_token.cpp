#include "id_token.hpp"

#include "../crypto/factories.hpp"
#include "../crypto/primitives.hpp"

#include <array>
#include <limits>
#include <stdexcept>

namespace pqoidc {

namespace {

const std::array<const char *, 6> kReservedClaims = {"iss", "sub", "aud", "iat", "exp", "nbf"};

struct TokenParts {
    std::string header_b64;
    std::string claims_b64;
    std::string signature_b64;
};

TokenParts split_token(const std::string &token) {
    const auto first = token.find('.');
    if (first == std::string::npos) {
        throw TokenError(TokenErrorCode::MalformedToken);
    }
    const auto second = token.find('.', first + 1);
    if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
        throw TokenError(TokenErrorCode::MalformedToken);
    }

    TokenParts parts;
    parts.header_b64 = token.substr(0, first);
    parts.claims_b64 = token.substr(first + 1, second - first - 1);
    parts.signature_b64 = token.substr(second + 1);
    return parts;
}

JsonObject decode_segment(const std::string &segment) {
    try {
        const Bytes raw = base64url_decode(segment);
        return json_decode_object(std::string(raw.begin(), raw.end()));
    } catch (const std::invalid_argument &) {
        throw TokenError(TokenErrorCode::MalformedToken);
    }
}

void reject_reserved(const JsonObject &claims) {
    for (const char *name : kReservedClaims) {
        if (claims.count(name) != 0) {
            throw std::invalid_argument(std::string("reserved claim supplied by caller: ") + name);
        }
    }
}

Bytes to_bytes(const std::string &s) {
    return Bytes(s.begin(), s.end());
}

} // namespace

const char *token_error_code_name(TokenErrorCode code) {
    switch (code) {
    case TokenErrorCode::MalformedToken: return "malformed_token";
    case TokenErrorCode::BadAlgorithm: return "bad_algorithm";
    case TokenErrorCode::BadSignature: return "bad_signature";
    case TokenErrorCode::Expired: return "token_expired";
    case TokenErrorCode::NotYetValid: return "token_not_yet_valid";
    case TokenErrorCode::AudienceMismatch: return "audience_mismatch";
    case TokenErrorCode::IssuerMismatch: return "issuer_mismatch";
    }
    return "token_error";
}

TokenCodec::TokenCodec(std::shared_ptr<const SignatureProvider> provider,
                       SigKeyPair keypair,
                       std::string issuer,
                       const Clock &clock)
    : provider_(std::move(provider)),
      keypair_(std::move(keypair)),
      issuer_(std::move(issuer)),
      clock_(&clock) {
    if (!provider_) {
        throw std::invalid_argument("token codec requires a signature provider");
    }
    if (keypair_.public_key.size() != provider_->public_key_size()) {
        throw std::invalid_argument("token codec public key has wrong size");
    }
    if (!keypair_.secret_key.empty() &&
        keypair_.secret_key.size() != provider_->secret_key_size()) {
        throw std::invalid_argument("token codec secret key has wrong size");
    }
}

TokenCodec TokenCodec::generate(SigAlgorithm alg, std::string issuer, const Clock &clock) {
    std::shared_ptr<const SignatureProvider> provider = make_signature_provider(alg);
    SigKeyPair keypair = provider->generate_keypair();
    return TokenCodec(std::move(provider), std::move(keypair), std::move(issuer), clock);
}

TokenCodec TokenCodec::verifier(SigAlgorithm alg, Bytes public_key, const Clock &clock) {
    std::shared_ptr<const SignatureProvider> provider = make_signature_provider(alg);
    SigKeyPair keypair;
    keypair.public_key = std::move(public_key);
    return TokenCodec(std::move(provider), std::move(keypair), std::string(), clock);
}

std::string TokenCodec::create(const JsonObject &claims,
                               const std::string &issuer,
                               const std::string &subject,
                               const std::string &audience,
                               std::int64_t ttl,
                               const JsonObject &extra_claims) const {
    if (!can_sign()) {
        throw std::runtime_error("token codec has no signing key");
    }
    if (ttl <= 0) {
        throw std::invalid_argument("token lifetime must be positive");
    }
    reject_reserved(claims);
    reject_reserved(extra_claims);

    const std::int64_t now = clock_->now();
    if (now > 0 && ttl > std::numeric_limits<std::int64_t>::max() - now) {
        throw std::invalid_argument("token lifetime overflows the expiry time");
    }

    JsonObject payload = claims;
    for (const auto &kv : extra_claims) {
        payload[kv.first] = kv.second;
    }
    payload["iss"] = issuer;
    payload["sub"] = subject;
    payload["aud"] = audience;
    payload["iat"] = now;
    payload["exp"] = now + ttl;
    payload["nbf"] = now;

    JsonObject header;
    header["alg"] = sig_algorithm_name(algorithm());
    header["typ"] = "JWT";

    const std::string signing_input =
        base64url_encode(json_encode(header)) + "." + base64url_encode(json_encode(payload));
    const Bytes signature = provider_->sign(keypair_.secret_key, to_bytes(signing_input));
    return signing_input + "." + base64url_encode(signature);
}

std::string TokenCodec::create_id_token(const std::string &user_id,
                                        const std::string &client_id,
                                        const std::optional<std::string> &nonce,
                                        std::optional<std::int64_t> auth_time,
                                        std::int64_t ttl,
                                        const JsonObject &extra_claims) const {
    JsonObject claims = extra_claims;
    claims["auth_time"] = auth_time ? *auth_time : clock_->now();
    if (nonce) {
        claims["nonce"] = *nonce;
    }
    return create(claims, issuer_, user_id, client_id, ttl);
}

JsonObject TokenCodec::verify(const std::string &token, const VerifyOptions &options) const {
    return verify(token, keypair_.public_key, options);
}

JsonObject TokenCodec::verify(const std::string &token, const Bytes &public_key,
                              const VerifyOptions &options) const {
    const TokenParts parts = split_token(token);

    const JsonObject header = decode_segment(parts.header_b64);
    const auto alg = json_get_string(header, "alg");
    if (!alg) {
        throw TokenError(TokenErrorCode::MalformedToken);
    }
    try {
        if (sig_algorithm_from_name(*alg) != algorithm()) {
            throw TokenError(TokenErrorCode::BadAlgorithm);
        }
    } catch (const std::invalid_argument &) {
        throw TokenError(TokenErrorCode::BadAlgorithm);
    }

    Bytes signature;
    try {
        signature = base64url_decode(parts.signature_b64);
    } catch (const std::invalid_argument &) {
        throw TokenError(TokenErrorCode::MalformedToken);
    }

    // Signature covers the segments as received, before any claim parsing.
    const Bytes signing_input = to_bytes(parts.header_b64 + "." + parts.claims_b64);
    if (!provider_->verify(public_key, signing_input, signature)) {
        throw TokenError(TokenErrorCode::BadSignature);
    }

    JsonObject claims = decode_segment(parts.claims_b64);

    if (options.check_expiry) {
        const std::int64_t now = clock_->now();
        const auto exp = json_get_int(claims, "exp");
        if (!exp || now > *exp) {
            throw TokenError(TokenErrorCode::Expired);
        }
        const auto nbf = json_get_int(claims, "nbf");
        if (nbf && now < *nbf) {
            throw TokenError(TokenErrorCode::NotYetValid);
        }
    }

    if (options.audience) {
        const auto aud = json_get_string(claims, "aud");
        if (!aud || *aud != *options.audience) {
            throw TokenError(TokenErrorCode::AudienceMismatch);
        }
    }

    if (options.issuer) {
        const auto iss = json_get_string(claims, "iss");
        if (!iss || *iss != *options.issuer) {
            throw TokenError(TokenErrorCode::IssuerMismatch);
        }
    }

    return claims;
}

DecodedToken decode_unverified(const std::string &token) {
    const TokenParts parts = split_token(token);
    DecodedToken decoded;
    decoded.header = decode_segment(parts.header_b64);
    decoded.claims = decode_segment(parts.claims_b64);
    return decoded;
}

} // namespace pqoidc
