#pragma once

#include "Benchmark.hpp"
#include "Mechanism.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pqc_bench {

// One report row
struct BenchmarkResult {
    std::string algorithm;
    AlgorithmType type;

    size_t public_key_bytes = 0;
    size_t secret_key_bytes = 0;
    std::optional<size_t> ciphertext_bytes; // KEM only
    std::optional<size_t> signature_bytes;  // Signature only

    double keygen_ms = 0.0;
    double encaps_sign_ms = 0.0;
    double decaps_verify_ms = 0.0;
};

// Arithmetic mean. Throws std::invalid_argument for an empty sequence.
double Mean(const std::vector<double>& samples);

BenchmarkResult Aggregate(const BenchmarkTarget& target,
                          const MechanismDetails& details,
                          const TimingSamples& samples);

} // namespace pqc_bench
