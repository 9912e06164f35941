#include "Aggregator.hpp"

#include <numeric>
#include <stdexcept>

namespace pqc_bench {

double Mean(const std::vector<double>& samples) {
    if (samples.empty()) {
        throw std::invalid_argument("Mean of an empty sample set is undefined");
    }
    double sum = std::accumulate(samples.begin(), samples.end(), 0.0);
    return sum / static_cast<double>(samples.size());
}

BenchmarkResult Aggregate(const BenchmarkTarget& target,
                          const MechanismDetails& details,
                          const TimingSamples& samples) {
    BenchmarkResult result;
    result.algorithm = target.name;
    result.type = target.type;
    result.public_key_bytes = details.length_public_key;
    result.secret_key_bytes = details.length_secret_key;

    if (target.type == AlgorithmType::KEM) {
        result.ciphertext_bytes = details.length_ciphertext;
    } else {
        result.signature_bytes = details.length_signature;
    }

    result.keygen_ms = Mean(samples.keygen_ms);
    result.encaps_sign_ms = Mean(samples.encaps_sign_ms);
    result.decaps_verify_ms = Mean(samples.decaps_verify_ms);
    return result;
}

} // namespace pqc_bench
