#include "audit_logger.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace pqoidc {

AuditLogger::AuditLogger(const std::string &log_path) : log_path_(log_path) {}

void AuditLogger::log_event(const std::string &event_type, const std::string &payload_json) const {
    namespace fs = std::filesystem;

    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    std::ostringstream line;
    line << "{"
         << "\"ts\":" << secs << ","
         << "\"event\":" << json_quote(event_type) << ",";
    // payload_json is assumed to be valid JSON object or value
    line << "\"payload\":" << (payload_json.empty() ? "null" : payload_json);
    line << "}" << '\n';

    std::lock_guard<std::mutex> lock(mu_);
    if (log_path_.empty()) {
        std::cerr << line.str();
        return;
    }

    // Best effort: failures are reported locally and never reach the caller.
    std::error_code ec;
    fs::path p(log_path_);
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            std::cerr << "audit: cannot create " << p.parent_path() << ": " << ec.message() << '\n';
            return;
        }
    }

    std::ofstream out(log_path_, std::ios::app);
    if (!out.is_open()) {
        std::cerr << "audit: cannot open " << log_path_ << '\n';
        return;
    }
    out << line.str();
}

void AuditLogger::log_event(const std::string &event_type, const JsonObject &payload) const {
    log_event(event_type, json_encode(payload));
}

} // namespace pqoidc
