#pragma once

#include "interfaces.hpp"

namespace pqoidc {

// liboqs-backed factories. Throw std::runtime_error when the algorithm is
// compiled out of the linked liboqs.
std::unique_ptr<KemProvider>       make_kem_provider(KemAlgorithm alg);
std::unique_ptr<SignatureProvider> make_signature_provider(SigAlgorithm alg);

// OpenSSL-backed HKDF.
std::unique_ptr<HkdfProvider>      make_hkdf_sha256_provider();

} // namespace pqoidc
