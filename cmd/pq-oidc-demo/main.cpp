#include "../../crypto/primitives.hpp"
#include "../../crypto/suite.hpp"
#include "../../kemtls/handshake.hpp"
#include "../../oidc/demo.hpp"
#include "../../oidc/relying_party.hpp"
#include "../../oidc/url.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

using namespace pqoidc;

const char *kIssuer = "http://localhost:5000";
const char *kServerName = "CN=PQ-OIDC-Server";

void print_claims(const JsonObject &claims) {
    for (const auto &kv : claims) {
        std::cout << "    " << kv.first << " = " << json_encode(kv.second) << "\n";
    }
}

void run_handshake(const CryptoSuite &suite) {
    std::cout << "== KEMTLS handshake (" << kem_algorithm_name(suite.kem->algorithm()) << ", "
              << sig_algorithm_name(suite.sig->algorithm()) << ")\n";

    auto certificate = std::make_shared<const Certificate>(issue_server_certificate(kServerName, suite));
    KemtlsServer server(certificate, suite);

    ClientOptions opts;
    opts.expected_subject = kServerName;
    opts.expected_server_kem = suite.kem->algorithm();
    KemtlsClient client(suite.kem, suite.hkdf, opts);

    auto channels = MemoryChannel::make_pair();

    std::exception_ptr server_error;
    Session server_session;
    std::thread server_thread([&] {
        try {
            server_session = perform_server_handshake(server, *channels.second);
        } catch (const std::exception &) {
            server_error = std::current_exception();
        }
    });

    Session client_session;
    try {
        client_session = perform_client_handshake(client, *channels.first);
    } catch (const std::exception &) {
        server_thread.join();
        throw;
    }
    server_thread.join();
    if (server_error) {
        std::rethrow_exception(server_error);
    }

    if (client_session.encryption_key() != server_session.encryption_key() ||
        client_session.mac_key() != server_session.mac_key() ||
        client_session.iv() != server_session.iv()) {
        throw std::runtime_error("session keys differ between peers");
    }

    std::cout << "  client state:   " << handshake_state_name(client.state()) << "\n"
              << "  server state:   " << handshake_state_name(server.state()) << "\n"
              << "  certificate:    " << client.server_certificate()->subject() << "\n"
              << "  transcript:     " << to_hex(client_session.transcript_hash()) << "\n"
              << "  encryption key: " << to_hex(client_session.encryption_key()) << "\n";
}

void run_code_flow(SigAlgorithm sig) {
    std::cout << "== OIDC authorization code flow\n";

    auto codec = std::make_shared<const TokenCodec>(TokenCodec::generate(sig, kIssuer));
    auto server = make_demo_server(ServerSettings{kIssuer, 600, 3600}, codec);

    auto verifier = std::make_shared<const TokenCodec>(TokenCodec::verifier(sig, codec->public_key()));
    RelyingParty rp(kDemoClientId, kDemoClientSecret, kIssuer, kDemoRedirectUri, verifier);

    const std::string url = rp.authorization_url();
    std::cout << "  authorize: " << url << "\n";

    const auto q = parse_query(url);
    AuthorizationRequest req;
    req.response_type = q.at("response_type");
    req.client_id = q.at("client_id");
    req.redirect_uri = q.at("redirect_uri");
    req.scope = q.at("scope");
    req.state = q.at("state");
    req.nonce = q.at("nonce");

    AuthorizationResponse first = server->handle_authorization_request(req);
    if (first.outcome != AuthorizationOutcome::NeedsLogin) {
        throw std::runtime_error("expected a login prompt");
    }

    auto user_id = server->authenticate(kDemoUsername, kDemoPassword);
    if (!user_id) {
        throw std::runtime_error("demo login failed");
    }
    req.session_id = server->create_session(*user_id);
    std::cout << "  logged in as " << kDemoUsername << " (" << *user_id << ")\n";

    AuthorizationResponse auth = server->handle_authorization_request(req);
    if (auth.outcome != AuthorizationOutcome::Redirect || auth.error) {
        throw std::runtime_error("authorization did not issue a code");
    }
    std::cout << "  callback:  " << auth.redirect_to << "\n";

    CallbackParams cb = rp.validate_callback(auth.redirect_to);
    PreparedTokenRequest prepared = rp.token_request(cb.code, cb.state);

    TokenResponse tokens = server->handle_token_request(prepared.request);
    if (!tokens.ok()) {
        throw std::runtime_error(std::string("token request failed: ") + oauth_error_code(*tokens.error));
    }
    std::cout << "  token response: " << tokens.tokens->to_json().size() << " bytes, scope \""
              << tokens.tokens->scope << "\"\n";

    JsonObject claims = rp.verify_id_token(tokens.tokens->id_token, prepared.expected_nonce);
    std::cout << "  verified id token claims:\n";
    print_claims(claims);

    UserInfoResponse info = server->handle_userinfo_request(tokens.tokens->access_token);
    if (info.ok()) {
        std::cout << "  userinfo:\n";
        print_claims(*info.claims);
    }

    TokenResponse replay = server->handle_token_request(prepared.request);
    std::cout << "  second exchange of the same code: "
              << (replay.ok() ? "accepted" : oauth_error_code(*replay.error)) << "\n";
}

} // namespace

int main(int argc, char **argv) {
    using namespace pqoidc;

    try {
        KemAlgorithm kem = argc > 1 ? kem_algorithm_from_name(argv[1]) : KemAlgorithm::MlKem768;
        SigAlgorithm sig = argc > 2 ? sig_algorithm_from_name(argv[2]) : SigAlgorithm::MlDsa44;

        run_handshake(make_suite(kem, sig));
        run_code_flow(sig);
    } catch (const std::exception &e) {
        std::cerr << "pq-oidc-demo: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
