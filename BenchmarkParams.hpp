#pragma once

#include <array>
#include <cstddef>

namespace pqc_bench {

// Iterations per algorithm, enough for a stable average
constexpr int DEFAULT_ITERATIONS = 100;

// NIST-selected primary standards, by their liboqs identifiers
constexpr std::array<const char*, 1> DEFAULT_KEM_ALGORITHMS = {
    "Kyber768",
};
constexpr std::array<const char*, 3> DEFAULT_SIGNATURE_ALGORITHMS = {
    "Dilithium3",
    "Falcon-512",
    "SPHINCS+-SHA2-128f-simple",
};

// Output location
constexpr const char* DEFAULT_RESULTS_DIR = "results/tables";
constexpr const char* DEFAULT_OUTPUT_FILE = "pqc_benchmark_results.csv";

// Signed on every signature iteration. Never derived from the key or the iteration.
constexpr const char* SIGNATURE_MESSAGE = "This is a sample message for signing.";

// A progress dot is printed every PROGRESS_INTERVAL iterations at debug level
constexpr int PROGRESS_INTERVAL = 10;

// Classical baselines (OpenSSL)
constexpr const char* BASELINE_KEM_ALGORITHM = "X25519";
constexpr const char* BASELINE_SIGNATURE_ALGORITHM = "Ed25519";

constexpr size_t X25519_PUBKEY_SIZE = 32;
constexpr size_t X25519_PRIVKEY_SIZE = 32;
constexpr size_t X25519_SHARED_SECRET_SIZE = 32;

constexpr size_t ED25519_PUBKEY_SIZE = 32;
constexpr size_t ED25519_PRIVKEY_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

} // namespace pqc_bench
