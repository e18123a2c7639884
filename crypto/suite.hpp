#pragma once

#include "interfaces.hpp"

namespace pqoidc {

// Resolves both algorithm ids to providers once; callers hold the suite for
// the lifetime of the server or connection.
CryptoSuite make_suite(KemAlgorithm kem, SigAlgorithm sig);

} // namespace pqoidc
