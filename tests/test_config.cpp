#include <catch2/catch.hpp>

#include "../audit/audit_logger.hpp"
#include "../policy/config.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace pqoidc;

namespace {

std::string write_temp(const std::string &name, const std::string &content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

} // namespace

TEST_CASE("config defaults", "[config]") {
    Config cfg;
    REQUIRE(cfg.socket_path == "/run/pq-oidcd.sock");
    REQUIRE(cfg.issuer == "https://pq-oidc.example.com");
    REQUIRE(cfg.kem_algorithm == KemAlgorithm::MlKem512);
    REQUIRE(cfg.sig_algorithm == SigAlgorithm::MlDsa44);
    REQUIRE(cfg.code_lifetime == 600);
    REQUIRE(cfg.token_lifetime == 3600);
    REQUIRE(cfg.seed_demo);
}

TEST_CASE("config file overrides", "[config]") {
    std::string path = write_temp("pqoidc_config_ok.yaml",
                                  "# daemon settings\n"
                                  "socket_path: /tmp/pq.sock\n"
                                  "\n"
                                  "issuer: \"https://auth.test\"   # quoted\n"
                                  "kem_algorithm: Kyber768\n"
                                  "sig_algorithm: 'Falcon-512'\n"
                                  "token_lifetime: 900\n"
                                  "seed_demo: false\n");
    Config cfg = load_config(path);
    REQUIRE(cfg.socket_path == "/tmp/pq.sock");
    REQUIRE(cfg.issuer == "https://auth.test");
    REQUIRE(cfg.kem_algorithm == KemAlgorithm::MlKem768);
    REQUIRE(cfg.sig_algorithm == SigAlgorithm::Falcon512);
    REQUIRE(cfg.token_lifetime == 900);
    REQUIRE(cfg.code_lifetime == 600);
    REQUIRE_FALSE(cfg.seed_demo);
    std::remove(path.c_str());
}

TEST_CASE("config errors name the line", "[config]") {
    auto expect_error = [](const std::string &content, const std::string &fragment) {
        std::string path = write_temp("pqoidc_config_bad.yaml", content);
        try {
            load_config(path);
            FAIL("config accepted: " << content);
        } catch (const std::invalid_argument &e) {
            REQUIRE(std::string(e.what()).find(fragment) != std::string::npos);
        }
        std::remove(path.c_str());
    };

    expect_error("issuer: x\nlisten_port: 80\n", ":2: unknown key");
    expect_error("code_lifetime: ten\n", ":1:");
    expect_error("token_lifetime: -5\n", ":1:");
    expect_error("token_lifetime: 9223372036854775807\n", ":1: lifetime exceeds");
    expect_error("code_lifetime: 99999999999999999999\n", ":1: value out of range");
    expect_error("kem_algorithm: RSA\n", ":1:");
    expect_error("just words\n", ":1:");

    REQUIRE_THROWS_AS(load_config("/nonexistent/pq-oidcd.yaml"), std::runtime_error);
}

TEST_CASE("audit logger writes JSON lines", "[audit]") {
    auto dir = std::filesystem::temp_directory_path() / "pqoidc_audit_test";
    std::filesystem::remove_all(dir);
    auto path = (dir / "audit.log").string();

    AuditLogger audit(path);
    audit.log_event("token_issued", JsonObject{{"client_id", "demo-client"}});
    audit.log_event("request", "{\"bytes\":12}");

    std::ifstream in(path);
    std::string first, second;
    REQUIRE(static_cast<bool>(std::getline(in, first)));
    REQUIRE(static_cast<bool>(std::getline(in, second)));

    JsonObject line = json_decode_object(first.substr(0, first.find(",\"payload\"")) + "}");
    REQUIRE(line.at("event").as_string() == "token_issued");
    REQUIRE(first.find("\"payload\":{\"client_id\":\"demo-client\"}") != std::string::npos);
    REQUIRE(second.find("\"event\":\"request\"") != std::string::npos);

    std::filesystem::remove_all(dir);
}
