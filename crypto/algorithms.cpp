#include "algorithms.hpp"

#include <stdexcept>

namespace pqoidc {

std::string kem_algorithm_name(KemAlgorithm alg) {
    switch (alg) {
    case KemAlgorithm::MlKem512: return "ML-KEM-512";
    case KemAlgorithm::MlKem768: return "ML-KEM-768";
    case KemAlgorithm::MlKem1024: return "ML-KEM-1024";
    }
    throw std::invalid_argument("unknown KEM algorithm");
}

std::string sig_algorithm_name(SigAlgorithm alg) {
    switch (alg) {
    case SigAlgorithm::MlDsa44: return "ML-DSA-44";
    case SigAlgorithm::MlDsa65: return "ML-DSA-65";
    case SigAlgorithm::MlDsa87: return "ML-DSA-87";
    case SigAlgorithm::Falcon512: return "Falcon-512";
    case SigAlgorithm::Falcon1024: return "Falcon-1024";
    }
    throw std::invalid_argument("unknown signature algorithm");
}

KemAlgorithm kem_algorithm_from_name(const std::string &name) {
    if (name == "ML-KEM-512" || name == "Kyber512") return KemAlgorithm::MlKem512;
    if (name == "ML-KEM-768" || name == "Kyber768") return KemAlgorithm::MlKem768;
    if (name == "ML-KEM-1024" || name == "Kyber1024") return KemAlgorithm::MlKem1024;
    throw std::invalid_argument("unknown KEM algorithm: " + name);
}

SigAlgorithm sig_algorithm_from_name(const std::string &name) {
    if (name == "ML-DSA-44") return SigAlgorithm::MlDsa44;
    if (name == "ML-DSA-65") return SigAlgorithm::MlDsa65;
    if (name == "ML-DSA-87") return SigAlgorithm::MlDsa87;
    if (name == "Falcon-512") return SigAlgorithm::Falcon512;
    if (name == "Falcon-1024") return SigAlgorithm::Falcon1024;
    throw std::invalid_argument("unknown signature algorithm: " + name);
}

KemAlgorithm kem_algorithm_from_id(std::uint8_t id) {
    switch (id) {
    case 1: return KemAlgorithm::MlKem512;
    case 2: return KemAlgorithm::MlKem768;
    case 3: return KemAlgorithm::MlKem1024;
    default: break;
    }
    throw std::invalid_argument("unknown KEM algorithm id " + std::to_string(id));
}

SigAlgorithm sig_algorithm_from_id(std::uint8_t id) {
    switch (id) {
    case 1: return SigAlgorithm::MlDsa44;
    case 2: return SigAlgorithm::MlDsa65;
    case 3: return SigAlgorithm::MlDsa87;
    case 4: return SigAlgorithm::Falcon512;
    case 5: return SigAlgorithm::Falcon1024;
    default: break;
    }
    throw std::invalid_argument("unknown signature algorithm id " + std::to_string(id));
}

} // namespace pqoidc
