#pragma once

#include <chrono>
#include <cstdint>

namespace pqoidc {

// Upper bound for configured code and token lifetimes (one year).
constexpr std::int64_t kMaxLifetimeSeconds = 366LL * 24 * 3600;

// Wall-clock source in unix seconds. Read on every check, never cached.
class Clock {
public:
    virtual ~Clock() = default;

    virtual std::int64_t now() const = 0;
};

class SystemClock : public Clock {
public:
    std::int64_t now() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

inline const Clock &system_clock() {
    static const SystemClock clock;
    return clock;
}

} // namespace pqoidc
