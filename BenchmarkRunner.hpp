#pragma once

#include "Aggregator.hpp"
#include "Benchmark.hpp"
#include "Clock.hpp"
#include "Config.hpp"
#include "Logger.hpp"
#include "Mechanism.hpp"

#include <string>
#include <vector>

namespace pqc_bench {

// Benchmarks every configured target in order and writes the report once, at the end.
// A disabled mechanism is skipped; any other error propagates and nothing is written.
class BenchmarkRunner {
public:
    // baseline_provider may be null when baselines are not configured
    BenchmarkRunner(const BenchmarkConfig& config,
                    MechanismProvider& pqc_provider,
                    MechanismProvider* baseline_provider,
                    Clock& clock,
                    Logger& logger);

    std::vector<BenchmarkResult> Run();

    // One target. Throws MechanismNotEnabledError when the provider has it disabled.
    BenchmarkResult BenchmarkKem(const BenchmarkTarget& target);
    BenchmarkResult BenchmarkSignature(const BenchmarkTarget& target);

private:
    const BenchmarkConfig& m_config;
    MechanismProvider& m_pqc_provider;
    MechanismProvider* m_baseline_provider;
    Logger& m_logger;
    Benchmark m_benchmark;

    MechanismProvider& ProviderFor(const BenchmarkTarget& target);
    // security_notion names the strong_security flag: IND-CCA or EUF-CMA
    void LogDetails(const MechanismDetails& details, const std::string& security_notion);
};

} // namespace pqc_bench
