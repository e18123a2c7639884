#pragma once

#include "../crypto/algorithms.hpp"

#include <cstdint>
#include <string>

namespace pqoidc {

constexpr const char *kDefaultConfigPath = "/etc/pq-oidc/pq-oidcd.yaml";

struct Config {
    std::string socket_path = "/run/pq-oidcd.sock";
    std::string log_path = "/var/log/pq-oidc/audit.log";
    std::string issuer = "https://pq-oidc.example.com";
    std::string server_name = "CN=PQ-OIDC-Server";
    KemAlgorithm kem_algorithm = KemAlgorithm::MlKem512;
    SigAlgorithm sig_algorithm = SigAlgorithm::MlDsa44;
    std::int64_t code_lifetime = 600;
    std::int64_t token_lifetime = 3600;
    bool seed_demo = true;
};

// Flat "key: value" file; '#' starts a comment, values may be quoted.
// Throws std::invalid_argument naming the line for an unknown key or a bad
// value, std::runtime_error if the file cannot be read.
Config load_config(const std::string &path);

// load_config(kDefaultConfigPath) when that file exists, else defaults.
Config load_config_or_default();

} // namespace pqoidc
