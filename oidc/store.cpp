#include "store.hpp"

#include "../crypto/primitives.hpp"

#include <utility>

namespace pqoidc {

namespace {

template <typename Map>
std::string unused_token(const Map &table) {
    std::string token = random_token();
    while (table.count(token) != 0) {
        token = random_token();
    }
    return token;
}

} // namespace

const char *redeem_status_name(RedeemStatus status) {
    switch (status) {
    case RedeemStatus::Ok: return "ok";
    case RedeemStatus::NotFound: return "not_found";
    case RedeemStatus::AlreadyUsed: return "already_used";
    case RedeemStatus::Expired: return "expired";
    case RedeemStatus::ClientMismatch: return "client_mismatch";
    case RedeemStatus::RedirectMismatch: return "redirect_mismatch";
    }
    return "unknown";
}

void AuthorizationStore::add_user(User user) {
    std::lock_guard<std::mutex> lock(mu_);
    std::string key = user.username;
    users_[key] = std::move(user);
}

std::optional<User> AuthorizationStore::find_user_by_username(const std::string &username) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = users_.find(username);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<User> AuthorizationStore::find_user_by_id(const std::string &user_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto &kv : users_) {
        if (kv.second.user_id == user_id) {
            return kv.second;
        }
    }
    return std::nullopt;
}

void AuthorizationStore::add_client(Client client) {
    std::lock_guard<std::mutex> lock(mu_);
    std::string key = client.client_id;
    clients_[key] = std::move(client);
}

std::optional<Client> AuthorizationStore::find_client(const std::string &client_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = clients_.find(client_id);
    if (it == clients_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string AuthorizationStore::create_session(const std::string &user_id, std::int64_t auth_time) {
    std::lock_guard<std::mutex> lock(mu_);
    LoginSession session;
    session.session_id = unused_token(sessions_);
    session.user_id = user_id;
    session.auth_time = auth_time;
    std::string id = session.session_id;
    sessions_.emplace(id, std::move(session));
    return id;
}

std::optional<LoginSession> AuthorizationStore::find_session(const std::string &session_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string AuthorizationStore::insert_code(AuthorizationCode record) {
    std::lock_guard<std::mutex> lock(mu_);
    record.code = unused_token(codes_);
    record.used = false;
    std::string code = record.code;
    codes_.emplace(code, std::move(record));
    return code;
}

RedeemResult AuthorizationStore::redeem_code(const std::string &code,
                                             const std::string &client_id,
                                             const std::string &redirect_uri,
                                             std::int64_t now) {
    std::lock_guard<std::mutex> lock(mu_);
    RedeemResult result;

    auto it = codes_.find(code);
    if (it == codes_.end()) {
        result.status = RedeemStatus::NotFound;
        return result;
    }
    AuthorizationCode &record = it->second;
    if (record.used) {
        result.status = RedeemStatus::AlreadyUsed;
    } else if (now > record.expires_at) {
        result.status = RedeemStatus::Expired;
    } else if (record.client_id != client_id) {
        result.status = RedeemStatus::ClientMismatch;
    } else if (record.redirect_uri != redirect_uri) {
        result.status = RedeemStatus::RedirectMismatch;
    } else {
        record.used = true;
        result.status = RedeemStatus::Ok;
        result.code = record;
    }
    return result;
}

std::string AuthorizationStore::insert_access_token(AccessTokenRecord record) {
    std::lock_guard<std::mutex> lock(mu_);
    record.token = unused_token(access_tokens_);
    std::string token = record.token;
    access_tokens_.emplace(token, std::move(record));
    return token;
}

std::optional<AccessTokenRecord> AuthorizationStore::find_access_token(const std::string &token) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = access_tokens_.find(token);
    if (it == access_tokens_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t AuthorizationStore::purge_expired(std::int64_t now) {
    std::lock_guard<std::mutex> lock(mu_);
    std::size_t removed = 0;
    for (auto it = codes_.begin(); it != codes_.end();) {
        if (it->second.expires_at < now) {
            it = codes_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    for (auto it = access_tokens_.begin(); it != access_tokens_.end();) {
        if (it->second.expires_at < now) {
            it = access_tokens_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t AuthorizationStore::code_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return codes_.size();
}

} // namespace pqoidc
