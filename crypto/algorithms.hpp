#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pqoidc {

using Bytes = std::vector<std::uint8_t>;

// Wire ids are stable; they appear as a single byte in handshake payloads and
// certificates.
enum class KemAlgorithm : std::uint8_t {
    MlKem512 = 1,
    MlKem768 = 2,
    MlKem1024 = 3
};

enum class SigAlgorithm : std::uint8_t {
    MlDsa44 = 1,
    MlDsa65 = 2,
    MlDsa87 = 3,
    Falcon512 = 4,
    Falcon1024 = 5
};

enum class HashAlgorithm {
    SHA2_256
};

std::string kem_algorithm_name(KemAlgorithm alg);
std::string sig_algorithm_name(SigAlgorithm alg);

// Accepts the NIST names ("ML-KEM-512") and the pre-standard Kyber names.
// Throws std::invalid_argument on anything else.
KemAlgorithm kem_algorithm_from_name(const std::string &name);
SigAlgorithm sig_algorithm_from_name(const std::string &name);

// Validates a wire id; throws std::invalid_argument for unknown values.
KemAlgorithm kem_algorithm_from_id(std::uint8_t id);
SigAlgorithm sig_algorithm_from_id(std::uint8_t id);

struct KemKeyPair {
    Bytes public_key;
    Bytes secret_key;
};

struct Encapsulation {
    Bytes ciphertext;
    Bytes shared_secret;
};

struct SigKeyPair {
    Bytes public_key;
    Bytes secret_key;
};

} // namespace pqoidc
