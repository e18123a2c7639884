#include "config.hpp"

#include "../common/clock.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace pqoidc {

namespace {

std::string trim(const std::string &s) {
    const char *ws = " \t\r";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::string strip_comment(const std::string &line) {
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

std::string unquote(const std::string &v) {
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
        return v.substr(1, v.size() - 2);
    }
    return v;
}

std::int64_t parse_seconds(const std::string &v) {
    std::size_t used = 0;
    long long n = std::stoll(v, &used);
    if (used != v.size() || n <= 0) {
        throw std::invalid_argument("expected a positive integer");
    }
    if (n > kMaxLifetimeSeconds) {
        throw std::invalid_argument("lifetime exceeds " + std::to_string(kMaxLifetimeSeconds) + " seconds");
    }
    return static_cast<std::int64_t>(n);
}

bool parse_bool(const std::string &v) {
    if (v == "true" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "no" || v == "off") return false;
    throw std::invalid_argument("expected true or false");
}

void apply(Config &cfg, const std::string &key, const std::string &value) {
    if (key == "socket_path") {
        cfg.socket_path = value;
    } else if (key == "log_path") {
        cfg.log_path = value;
    } else if (key == "issuer") {
        cfg.issuer = value;
    } else if (key == "server_name") {
        cfg.server_name = value;
    } else if (key == "kem_algorithm") {
        cfg.kem_algorithm = kem_algorithm_from_name(value);
    } else if (key == "sig_algorithm") {
        cfg.sig_algorithm = sig_algorithm_from_name(value);
    } else if (key == "code_lifetime") {
        cfg.code_lifetime = parse_seconds(value);
    } else if (key == "token_lifetime") {
        cfg.token_lifetime = parse_seconds(value);
    } else if (key == "seed_demo") {
        cfg.seed_demo = parse_bool(value);
    } else {
        throw std::invalid_argument("unknown key '" + key + "'");
    }
}

} // namespace

Config load_config(const std::string &path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open config file " + path);
    }

    Config cfg;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        const std::string body = trim(strip_comment(line));
        if (body.empty()) {
            continue;
        }

        const auto colon = body.find(':');
        if (colon == std::string::npos) {
            throw std::invalid_argument(path + ":" + std::to_string(lineno) + ": expected 'key: value'");
        }
        const std::string key = trim(body.substr(0, colon));
        const std::string value = unquote(trim(body.substr(colon + 1)));

        try {
            apply(cfg, key, value);
        } catch (const std::invalid_argument &e) {
            throw std::invalid_argument(path + ":" + std::to_string(lineno) + ": " + e.what());
        } catch (const std::out_of_range &) {
            throw std::invalid_argument(path + ":" + std::to_string(lineno) + ": value out of range");
        }
    }
    return cfg;
}

Config load_config_or_default() {
    std::error_code ec;
    if (std::filesystem::exists(kDefaultConfigPath, ec)) {
        return load_config(kDefaultConfigPath);
    }
    return Config{};
}

} // namespace pqoidc
