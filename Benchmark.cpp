#include "Benchmark.hpp"
#include "BenchmarkParams.hpp"
#include "Errors.hpp"

#include <stdexcept>
#include <string>

namespace pqc_bench {

namespace {

void CheckIterations(int iterations) {
    if (iterations <= 0) {
        throw std::invalid_argument("Iteration count must be positive, got " + std::to_string(iterations));
    }
}

void Reserve(TimingSamples& samples, int iterations) {
    samples.keygen_ms.reserve(iterations);
    samples.encaps_sign_ms.reserve(iterations);
    samples.decaps_verify_ms.reserve(iterations);
}

} // namespace

Benchmark::Benchmark(Clock& clock, Logger& logger)
    : m_clock(clock), m_logger(logger) {}

TimingSamples Benchmark::RunKem(KemMechanism& kem, int iterations) {
    CheckIterations(iterations);

    TimingSamples samples;
    Reserve(samples, iterations);

    for (int i = 0; i < iterations; ++i) {
        // 1. Key Generation
        auto t1 = m_clock.Now();
        KeyPair keys = kem.GenerateKeyPair();
        auto t2 = m_clock.Now();
        samples.keygen_ms.push_back(ElapsedMs(t1, t2));

        // 2. Encapsulation
        auto t3 = m_clock.Now();
        Encapsulation encap = kem.Encapsulate(keys.public_key);
        auto t4 = m_clock.Now();
        samples.encaps_sign_ms.push_back(ElapsedMs(t3, t4));

        // 3. Decapsulation
        auto t5 = m_clock.Now();
        Bytes shared_secret = kem.Decapsulate(keys.secret_key, encap.ciphertext);
        auto t6 = m_clock.Now();
        samples.decaps_verify_ms.push_back(ElapsedMs(t5, t6));

        if (shared_secret != encap.shared_secret) {
            m_logger.EndProgress();
            throw CorrectnessError("Shared secret mismatch for " + kem.Details().method_name +
                                   " at iteration " + std::to_string(i));
        }

        ReportProgress(i);
    }
    m_logger.EndProgress();

    return samples;
}

TimingSamples Benchmark::RunSignature(SignatureMechanism& sig, int iterations, const Bytes& message) {
    CheckIterations(iterations);

    TimingSamples samples;
    Reserve(samples, iterations);

    for (int i = 0; i < iterations; ++i) {
        // 1. Key Generation
        auto t1 = m_clock.Now();
        KeyPair keys = sig.GenerateKeyPair();
        auto t2 = m_clock.Now();
        samples.keygen_ms.push_back(ElapsedMs(t1, t2));

        // 2. Signing
        auto t3 = m_clock.Now();
        Bytes signature = sig.Sign(message, keys.secret_key);
        auto t4 = m_clock.Now();
        samples.encaps_sign_ms.push_back(ElapsedMs(t3, t4));

        // 3. Verification
        auto t5 = m_clock.Now();
        bool valid = sig.Verify(message, signature, keys.public_key);
        auto t6 = m_clock.Now();
        samples.decaps_verify_ms.push_back(ElapsedMs(t5, t6));

        if (!valid) {
            m_logger.EndProgress();
            throw CorrectnessError("Signature verification failed for " + sig.Details().method_name +
                                   " at iteration " + std::to_string(i));
        }

        ReportProgress(i);
    }
    m_logger.EndProgress();

    return samples;
}

void Benchmark::ReportProgress(int iteration) {
    if (iteration % PROGRESS_INTERVAL == 0) {
        m_logger.Progress('.');
    }
}

} // namespace pqc_bench
