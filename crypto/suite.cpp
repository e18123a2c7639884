#include "suite.hpp"
#include "factories.hpp"

namespace pqoidc {

// Wires together the KEM, signature and HKDF providers. It does not perform
// protocol logic itself; it just exposes providers to the handshake engine and
// token codec.
CryptoSuite make_suite(KemAlgorithm kem, SigAlgorithm sig) {
    CryptoSuite s;
    s.kem = make_kem_provider(kem);
    s.sig = make_signature_provider(sig);
    s.hkdf = make_hkdf_sha256_provider();
    return s;
}

} // namespace pqoidc
