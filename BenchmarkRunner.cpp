#include "BenchmarkRunner.hpp"
#include "BenchmarkParams.hpp"
#include "Errors.hpp"
#include "ReportWriter.hpp"

#include <cstring>
#include <string>

namespace pqc_bench {

BenchmarkRunner::BenchmarkRunner(const BenchmarkConfig& config,
                                 MechanismProvider& pqc_provider,
                                 MechanismProvider* baseline_provider,
                                 Clock& clock,
                                 Logger& logger)
    : m_config(config),
      m_pqc_provider(pqc_provider),
      m_baseline_provider(baseline_provider),
      m_logger(logger),
      m_benchmark(clock, logger) {}

std::vector<BenchmarkResult> BenchmarkRunner::Run() {
    const std::string rule(50, '=');
    m_logger.Info(rule);
    m_logger.Info("Starting PQC Algorithm Benchmark");
    m_logger.Info(rule);

    std::vector<BenchmarkResult> results;

    for (const auto& target : m_config.Targets()) {
        try {
            if (target.type == AlgorithmType::KEM) {
                results.push_back(BenchmarkKem(target));
            } else {
                results.push_back(BenchmarkSignature(target));
            }
        } catch (const MechanismNotEnabledError&) {
            m_logger.Warning("Algorithm " + target.name +
                             " is not enabled in this build of liboqs. Skipping.");
        }
    }

    ReportWriter writer(m_config.output_dir, m_config.output_file);
    if (!writer.Save(results)) {
        m_logger.Warning("No results to save. Exiting.");
        return results;
    }

    m_logger.Info("\n" + rule);
    m_logger.Info("Benchmark finished. Results saved to '" + writer.OutputPath().string() + "'");
    m_logger.Info(rule);

    if (m_logger.IsEnabled(LogLevel::ERROR)) {
        ReportWriter::PrintSummary(m_logger.Out(), results);
    }
    return results;
}

BenchmarkResult BenchmarkRunner::BenchmarkKem(const BenchmarkTarget& target) {
    m_logger.Info("\n--- Benchmarking KEM: " + target.name + " ---");

    // Released on every exit path
    auto kem = ProviderFor(target).CreateKem(target.name);
    LogDetails(kem->Details(), "IND-CCA");

    m_logger.Info("Running " + std::to_string(m_config.iterations) + " iterations...");
    TimingSamples samples = m_benchmark.RunKem(*kem, m_config.iterations);

    return Aggregate(target, kem->Details(), samples);
}

BenchmarkResult BenchmarkRunner::BenchmarkSignature(const BenchmarkTarget& target) {
    m_logger.Info("\n--- Benchmarking Signature: " + target.name + " ---");

    auto sig = ProviderFor(target).CreateSignature(target.name);
    LogDetails(sig->Details(), "EUF-CMA");

    const Bytes message(SIGNATURE_MESSAGE, SIGNATURE_MESSAGE + std::strlen(SIGNATURE_MESSAGE));

    m_logger.Info("Running " + std::to_string(m_config.iterations) + " iterations...");
    TimingSamples samples = m_benchmark.RunSignature(*sig, m_config.iterations, message);

    return Aggregate(target, sig->Details(), samples);
}

MechanismProvider& BenchmarkRunner::ProviderFor(const BenchmarkTarget& target) {
    if (target.backend == Backend::OQS) {
        return m_pqc_provider;
    }
    if (m_baseline_provider == nullptr) {
        throw MechanismNotSupportedError(target.name);
    }
    return *m_baseline_provider;
}

void BenchmarkRunner::LogDetails(const MechanismDetails& details, const std::string& security_notion) {
    m_logger.Debug("  method: " + details.method_name + " (version " + details.version + ")");
    m_logger.Debug("  claimed NIST level: " + std::to_string(details.claimed_nist_level));
    m_logger.Debug("  " + security_notion + ": " + (details.strong_security ? "yes" : "no"));
}

} // namespace pqc_bench
