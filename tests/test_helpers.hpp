#pragma once

#include "../common/clock.hpp"
#include "../crypto/suite.hpp"
#include "../kemtls/certificate.hpp"

#include <cstdint>
#include <memory>

namespace test_helpers {

class ManualClock : public pqoidc::Clock {
public:
    explicit ManualClock(std::int64_t start = 1700000000) : now_(start) {}

    std::int64_t now() const override { return now_; }
    void set(std::int64_t t) { now_ = t; }
    void advance(std::int64_t secs) { now_ += secs; }

private:
    std::int64_t now_;
};

// Key generation dominates test time; share one suite and certificate.
inline const pqoidc::CryptoSuite &default_suite() {
    static const pqoidc::CryptoSuite suite =
        pqoidc::make_suite(pqoidc::KemAlgorithm::MlKem512, pqoidc::SigAlgorithm::MlDsa44);
    return suite;
}

inline std::shared_ptr<const pqoidc::Certificate> default_certificate() {
    static const std::shared_ptr<const pqoidc::Certificate> cert =
        std::make_shared<const pqoidc::Certificate>(
            pqoidc::issue_server_certificate("CN=test-server", default_suite()));
    return cert;
}

} // namespace test_helpers
