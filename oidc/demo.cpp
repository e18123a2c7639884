#include "demo.hpp"

#include <stdexcept>
#include <utility>

namespace pqoidc {

User demo_user() {
    User user;
    user.user_id = kDemoUserId;
    user.username = kDemoUsername;
    user.password = kDemoPassword;
    user.email = "alice@example.com";
    user.name = "Alice Smith";
    user.given_name = "Alice";
    user.family_name = "Smith";
    return user;
}

Client demo_client() {
    Client client;
    client.client_id = kDemoClientId;
    client.client_secret = kDemoClientSecret;
    client.redirect_uris = {kDemoRedirectUri};
    client.grant_types = {"authorization_code"};
    client.response_types = {"code"};
    client.scopes = {"openid", "profile", "email"};
    return client;
}

std::unique_ptr<AuthorizationServer> make_demo_server(ServerSettings settings,
                                                      std::shared_ptr<const TokenCodec> codec,
                                                      const Clock &clock,
                                                      const AuditLogger *audit) {
    if (codec && codec->issuer() != settings.issuer) {
        throw std::invalid_argument("token codec issuer differs from server issuer");
    }
    auto server = std::make_unique<AuthorizationServer>(std::move(settings), std::move(codec),
                                                        std::make_shared<AuthorizationStore>(),
                                                        clock, audit);
    server->register_user(demo_user());
    server->register_client(demo_client());
    return server;
}

} // namespace pqoidc
