#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pqoidc {

struct User {
    std::string user_id;
    std::string username;
    std::string password; // plaintext placeholder; not a credential store
    std::string email;
    std::string name;
    std::string given_name;
    std::string family_name;
};

struct Client {
    std::string client_id;
    std::string client_secret;
    std::set<std::string> redirect_uris;
    std::set<std::string> grant_types;
    std::set<std::string> response_types;
    std::vector<std::string> scopes; // allowed scopes, in advertised order
};

struct AuthorizationCode {
    std::string code;
    std::string client_id;
    std::string user_id;
    std::string redirect_uri;
    std::vector<std::string> scopes;
    std::optional<std::string> nonce;
    std::int64_t auth_time = 0;
    std::int64_t expires_at = 0;
    bool used = false;
};

struct LoginSession {
    std::string session_id;
    std::string user_id;
    std::int64_t auth_time = 0;
};

struct AccessTokenRecord {
    std::string token;
    std::string user_id;
    std::string client_id;
    std::vector<std::string> scopes;
    std::int64_t expires_at = 0;
};

enum class RedeemStatus {
    Ok,
    NotFound,
    AlreadyUsed,
    Expired,
    ClientMismatch,
    RedirectMismatch
};

const char *redeem_status_name(RedeemStatus status);

struct RedeemResult {
    RedeemStatus status = RedeemStatus::NotFound;
    std::optional<AuthorizationCode> code; // set only for Ok
};

// Registries shared by concurrent requests. Every method takes the store
// lock, so each call is atomic with respect to the others.
class AuthorizationStore {
public:
    void add_user(User user);
    std::optional<User> find_user_by_username(const std::string &username) const;
    std::optional<User> find_user_by_id(const std::string &user_id) const;

    void add_client(Client client);
    std::optional<Client> find_client(const std::string &client_id) const;

    // Returns a fresh unguessable session id.
    std::string create_session(const std::string &user_id, std::int64_t auth_time);
    std::optional<LoginSession> find_session(const std::string &session_id) const;

    // Assigns record.code a value not present in the table and stores it.
    std::string insert_code(AuthorizationCode record);

    // Check-and-set under one lock: the code is marked used only when every
    // check passes, and a second redemption sees AlreadyUsed.
    RedeemResult redeem_code(const std::string &code,
                             const std::string &client_id,
                             const std::string &redirect_uri,
                             std::int64_t now);

    // Assigns record.token and stores it.
    std::string insert_access_token(AccessTokenRecord record);
    std::optional<AccessTokenRecord> find_access_token(const std::string &token) const;

    // Drops codes and access tokens whose expiry is before `now`. Returns the
    // number of entries removed.
    std::size_t purge_expired(std::int64_t now);

    std::size_t code_count() const;

private:
    mutable std::mutex mu_;
    std::map<std::string, User> users_; // by username
    std::map<std::string, Client> clients_;
    std::map<std::string, LoginSession> sessions_;
    std::map<std::string, AuthorizationCode> codes_;
    std::map<std::string, AccessTokenRecord> access_tokens_;
};

} // namespace pqoidc
