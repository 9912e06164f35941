#include "Config.hpp"
#include "BenchmarkParams.hpp"

#include <sstream>
#include <stdexcept>

namespace pqc_bench {

namespace {

const std::string& RequireValue(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("Missing value for " + args[i]);
    }
    return args[++i];
}

int ParseIterations(const std::string& value) {
    size_t consumed = 0;
    int iterations = 0;
    try {
        iterations = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid iteration count: " + value);
    }
    if (consumed != value.size() || iterations <= 0) {
        throw std::invalid_argument("Iteration count must be a positive integer: " + value);
    }
    return iterations;
}

} // namespace

BenchmarkConfig::BenchmarkConfig()
    : iterations(DEFAULT_ITERATIONS),
      kem_algorithms(DEFAULT_KEM_ALGORITHMS.begin(), DEFAULT_KEM_ALGORITHMS.end()),
      signature_algorithms(DEFAULT_SIGNATURE_ALGORITHMS.begin(), DEFAULT_SIGNATURE_ALGORITHMS.end()),
      output_dir(DEFAULT_RESULTS_DIR),
      output_file(DEFAULT_OUTPUT_FILE) {}

std::vector<BenchmarkTarget> BenchmarkConfig::Targets() const {
    std::vector<BenchmarkTarget> targets;
    for (const auto& name : kem_algorithms) {
        targets.push_back({name, AlgorithmType::KEM, Backend::OQS});
    }
    if (include_baselines) {
        targets.push_back({BASELINE_KEM_ALGORITHM, AlgorithmType::KEM, Backend::OpenSSL});
    }
    for (const auto& name : signature_algorithms) {
        targets.push_back({name, AlgorithmType::Signature, Backend::OQS});
    }
    if (include_baselines) {
        targets.push_back({BASELINE_SIGNATURE_ALGORITHM, AlgorithmType::Signature, Backend::OpenSSL});
    }
    return targets;
}

BenchmarkConfig ParseArgs(const std::vector<std::string>& args) {
    BenchmarkConfig config;

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--iterations" || arg == "-n") {
            config.iterations = ParseIterations(RequireValue(args, i));
        } else if (arg == "--kem") {
            config.kem_algorithms = SplitList(RequireValue(args, i));
        } else if (arg == "--sig") {
            config.signature_algorithms = SplitList(RequireValue(args, i));
        } else if (arg == "--output-dir") {
            config.output_dir = RequireValue(args, i);
        } else if (arg == "--output-file") {
            config.output_file = RequireValue(args, i);
            if (config.output_file.empty()) {
                throw std::invalid_argument("Output file name must not be empty");
            }
        } else if (arg == "--baseline") {
            config.include_baselines = true;
        } else if (arg == "--quiet" || arg == "-q") {
            config.log_level = LogLevel::ERROR;
        } else if (arg == "--verbose" || arg == "-v") {
            config.log_level = LogLevel::DEBUG;
        } else if (arg == "--list") {
            config.list_only = true;
        } else if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    return config;
}

std::vector<std::string> SplitList(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void PrintUsage(std::ostream& os, const std::string& program) {
    os << "PQC Benchmark: post-quantum KEM and signature latency and sizes" << std::endl;
    os << "Usage: " << program << " [options]" << std::endl;
    os << "  --iterations, -n <N>   Iterations per algorithm (default " << DEFAULT_ITERATIONS << ")" << std::endl;
    os << "  --kem <A,B,...>        KEM algorithms (liboqs names)" << std::endl;
    os << "  --sig <A,B,...>        Signature algorithms (liboqs names)" << std::endl;
    os << "  --output-dir <DIR>     Results directory (default " << DEFAULT_RESULTS_DIR << ")" << std::endl;
    os << "  --output-file <NAME>   CSV file name (default " << DEFAULT_OUTPUT_FILE << ")" << std::endl;
    os << "  --baseline             Also benchmark " << BASELINE_KEM_ALGORITHM << " and "
       << BASELINE_SIGNATURE_ALGORITHM << " through OpenSSL" << std::endl;
    os << "  --quiet, -q            Only errors and the summary table" << std::endl;
    os << "  --verbose, -v          Mechanism details and progress" << std::endl;
    os << "  --list                 List the mechanisms enabled in the linked liboqs" << std::endl;
    os << "  --help, -h             Show this help" << std::endl;
    os << std::endl;
    os << "The default names are the pre-standard ones. Recent liboqs releases only ship the" << std::endl;
    os << "FIPS 203/204 names, e.g. --kem ML-KEM-768 --sig ML-DSA-65" << std::endl;
}

} // namespace pqc_bench
