#pragma once

#include "../common/json.hpp"

#include <mutex>
#include <string>

namespace pqoidc {

class AuditLogger {
public:
    // An empty path writes events to stderr.
    explicit AuditLogger(const std::string &log_path);

    // Writes a single JSON line with type and payload (already JSON) embedded.
    void log_event(const std::string &event_type, const std::string &payload_json) const;

    void log_event(const std::string &event_type, const JsonObject &payload) const;

    const std::string &path() const { return log_path_; }

private:
    std::string log_path_;
    mutable std::mutex mu_;
};

} // namespace pqoidc
