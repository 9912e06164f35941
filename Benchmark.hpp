#pragma once

#include "Clock.hpp"
#include "Logger.hpp"
#include "Mechanism.hpp"

#include <vector>

namespace pqc_bench {

// Per-iteration elapsed milliseconds, in iteration order
struct TimingSamples {
    std::vector<double> keygen_ms;
    std::vector<double> encaps_sign_ms;
    std::vector<double> decaps_verify_ms;
};

// Times keygen and the two follow-up operations of a mechanism, iteration by iteration.
// Each step is timed on its own. Nothing is retried and there is no timeout.
class Benchmark {
public:
    Benchmark(Clock& clock, Logger& logger);

    // keygen, encapsulate, decapsulate.
    // Throws CorrectnessError as soon as the two shared secrets differ.
    TimingSamples RunKem(KemMechanism& kem, int iterations);

    // keygen, sign, verify.
    // Throws CorrectnessError as soon as a signature fails to verify.
    TimingSamples RunSignature(SignatureMechanism& sig, int iterations, const Bytes& message);

private:
    Clock& m_clock;
    Logger& m_logger;

    void ReportProgress(int iteration);
};

} // namespace pqc_bench
