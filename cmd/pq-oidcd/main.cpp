#include "../../audit/audit_logger.hpp"
#include "../../crypto/primitives.hpp"
#include "../../crypto/suite.hpp"
#include "../../kemtls/errors.hpp"
#include "../../kemtls/handshake.hpp"
#include "../../oidc/demo.hpp"
#include "../../oidc/server.hpp"
#include "../../policy/config.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

volatile std::sig_atomic_t g_terminate = 0;

void handle_signal(int) {
    g_terminate = 1;
}

using namespace pqoidc;

std::string field(const JsonObject &req, const std::string &key) {
    auto v = json_get_string(req, key);
    return v ? *v : std::string();
}

std::string denied(const std::string &kind, const std::string &error) {
    JsonObject resp;
    resp["kind"] = kind;
    resp["status"] = "DENIED";
    resp["error"] = error;
    return json_encode(resp);
}

// Wraps an already-encoded JSON document under "document".
std::string ok_document(const std::string &kind, const std::string &document) {
    return "{\"document\":" + document + ",\"kind\":" + json_quote(kind) + ",\"status\":\"OK\"}";
}

std::string handle_login(AuthorizationServer &server, const JsonObject &req) {
    auto user_id = server.authenticate(field(req, "username"), field(req, "password"));
    if (!user_id) {
        return denied("LOGIN", oauth_error_code(OAuthError::AccessDenied));
    }
    JsonObject resp;
    resp["kind"] = "LOGIN";
    resp["status"] = "OK";
    resp["session_id"] = server.create_session(*user_id);
    return json_encode(resp);
}

std::string handle_authorize(AuthorizationServer &server, const JsonObject &req) {
    AuthorizationRequest ar;
    ar.response_type = field(req, "response_type");
    ar.client_id = field(req, "client_id");
    ar.redirect_uri = field(req, "redirect_uri");
    ar.scope = field(req, "scope");
    ar.state = json_get_string(req, "state");
    ar.nonce = json_get_string(req, "nonce");
    ar.session_id = json_get_string(req, "session_id");

    AuthorizationResponse result = server.handle_authorization_request(ar);
    if (result.outcome == AuthorizationOutcome::Rejected) {
        return denied("AUTHORIZE", oauth_error_code(*result.error));
    }

    JsonObject resp;
    resp["kind"] = "AUTHORIZE";
    resp["status"] = "OK";
    if (result.outcome == AuthorizationOutcome::NeedsLogin) {
        resp["outcome"] = "login_required";
    } else {
        resp["outcome"] = "redirect";
        resp["redirect_to"] = result.redirect_to;
    }
    return json_encode(resp);
}

std::string handle_token(AuthorizationServer &server, const JsonObject &req) {
    TokenRequest tr;
    tr.grant_type = field(req, "grant_type");
    tr.code = field(req, "code");
    tr.redirect_uri = field(req, "redirect_uri");
    tr.client_id = field(req, "client_id");
    tr.client_secret = field(req, "client_secret");

    TokenResponse result = server.handle_token_request(tr);
    if (!result.ok()) {
        return denied("TOKEN", oauth_error_code(*result.error));
    }

    JsonObject resp = json_decode_object(result.tokens->to_json());
    resp["kind"] = "TOKEN";
    resp["status"] = "OK";
    return json_encode(resp);
}

std::string handle_userinfo(AuthorizationServer &server, const JsonObject &req) {
    UserInfoResponse result = server.handle_userinfo_request(field(req, "access_token"));
    if (!result.ok()) {
        return denied("USERINFO", oauth_error_code(*result.error));
    }
    JsonObject resp = *result.claims;
    resp["kind"] = "USERINFO";
    resp["status"] = "OK";
    return json_encode(resp);
}

std::string dispatch(AuthorizationServer &server, const std::string &line) {
    const JsonObject req = json_decode_object(line);
    const std::string kind = field(req, "kind");

    if (kind == "LOGIN") return handle_login(server, req);
    if (kind == "AUTHORIZE") return handle_authorize(server, req);
    if (kind == "TOKEN") return handle_token(server, req);
    if (kind == "USERINFO") return handle_userinfo(server, req);
    if (kind == "DISCOVERY") return ok_document(kind, server.discovery_document());
    if (kind == "JWKS") return ok_document(kind, server.jwks());
    return denied(kind, "unknown_kind");
}

bool write_all(int fd, const std::string &data) {
    std::size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<std::size_t>(n);
    }
    return true;
}

void serve_connection(int client_fd,
                      const std::shared_ptr<const Certificate> &certificate,
                      const CryptoSuite &suite,
                      AuthorizationServer &server,
                      const AuditLogger &audit) {
    KemtlsServer kemtls(certificate, suite);
    FdChannel channel(client_fd);
    try {
        Session session = perform_server_handshake(kemtls, channel);
        audit.log_event("handshake_complete",
                        JsonObject{{"kem", kem_algorithm_name(suite.kem->algorithm())},
                                   {"transcript", to_hex(session.transcript_hash())}});
    } catch (const HandshakeError &e) {
        audit.log_event("handshake_failed", JsonObject{{"error", e.what()}});
        return;
    } catch (const std::exception &e) {
        // I/O and liboqs failures end this connection, not the daemon.
        audit.log_event("handshake_failed", JsonObject{{"error", e.what()}});
        return;
    }

    std::string buffer;
    char chunk[1024];
    ssize_t n;
    while ((n = ::read(client_fd, chunk, sizeof(chunk))) > 0) {
        buffer.append(chunk, chunk + n);
        std::size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);

            if (line.empty()) continue;

            audit.log_event("request", JsonObject{{"bytes", static_cast<std::int64_t>(line.size())}});
            server.store().purge_expired(system_clock().now());

            std::string response_json;
            try {
                response_json = dispatch(server, line);
            } catch (const JsonError &ex) {
                audit.log_event("request_failed", JsonObject{{"error", ex.what()}});
                response_json = denied("", "invalid_request");
            } catch (const std::exception &ex) {
                audit.log_event("request_failed", JsonObject{{"error", ex.what()}});
                response_json = denied("", "server_error");
            }

            response_json.push_back('\n');
            if (!write_all(client_fd, response_json)) {
                std::perror("write");
                return;
            }
        }
    }
    if (n < 0) {
        std::perror("read");
    }
}

} // namespace

int main(int argc, char **argv) {
    using namespace pqoidc;

    Config cfg;
    try {
        cfg = argc > 1 ? load_config(argv[1]) : load_config_or_default();
    } catch (const std::exception &e) {
        std::cerr << "pq-oidcd: " << e.what() << std::endl;
        return 1;
    }
    AuditLogger audit(cfg.log_path);

    CryptoSuite suite;
    std::shared_ptr<const Certificate> certificate;
    std::unique_ptr<AuthorizationServer> server;
    try {
        suite = make_suite(cfg.kem_algorithm, cfg.sig_algorithm);
        certificate = std::make_shared<const Certificate>(
            issue_server_certificate(cfg.server_name, suite));

        auto codec = std::make_shared<const TokenCodec>(
            TokenCodec::generate(cfg.sig_algorithm, cfg.issuer));
        ServerSettings settings{cfg.issuer, cfg.code_lifetime, cfg.token_lifetime};
        if (cfg.seed_demo) {
            server = make_demo_server(settings, codec, system_clock(), &audit);
        } else {
            server = std::make_unique<AuthorizationServer>(settings, codec,
                                                           std::make_shared<AuthorizationStore>(),
                                                           system_clock(), &audit);
        }
    } catch (const std::exception &e) {
        std::cerr << "pq-oidcd: startup failed: " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    int server_fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd < 0) {
        std::perror("socket");
        return 1;
    }

    ::unlink(cfg.socket_path.c_str());

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, cfg.socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (::bind(server_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        std::perror("bind");
        ::close(server_fd);
        return 1;
    }

    if (::listen(server_fd, 16) < 0) {
        std::perror("listen");
        ::close(server_fd);
        return 1;
    }

    std::cout << "pq-oidcd listening on UNIX socket: " << cfg.socket_path
              << " (" << kem_algorithm_name(cfg.kem_algorithm) << ", "
              << sig_algorithm_name(cfg.sig_algorithm) << ")" << std::endl;

    while (!g_terminate) {
        int client_fd = ::accept(server_fd, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno == EINTR && g_terminate) {
                break;
            }
            std::perror("accept");
            continue;
        }

        serve_connection(client_fd, certificate, suite, *server, audit);
        ::close(client_fd);
    }

    ::close(server_fd);
    ::unlink(cfg.socket_path.c_str());
    std::cout << "pq-oidcd stopped" << std::endl;

    return 0;
}
