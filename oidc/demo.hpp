#pragma once

#include "server.hpp"

#include <memory>

namespace pqoidc {

constexpr const char *kDemoUsername = "alice";
constexpr const char *kDemoPassword = "password123";
constexpr const char *kDemoUserId = "user123";
constexpr const char *kDemoClientId = "demo-client";
constexpr const char *kDemoClientSecret = "demo-secret";
constexpr const char *kDemoRedirectUri = "http://localhost:8080/callback";

User demo_user();
Client demo_client();

// Server with the demo user and client registered and a fresh store.
// settings.issuer must equal codec->issuer().
std::unique_ptr<AuthorizationServer> make_demo_server(ServerSettings settings,
                                                      std::shared_ptr<const TokenCodec> codec,
                                                      const Clock &clock = system_clock(),
                                                      const AuditLogger *audit = nullptr);

} // namespace pqoidc
