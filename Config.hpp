#pragma once

#include "Logger.hpp"
#include "Mechanism.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace pqc_bench {

struct BenchmarkConfig {
    int iterations;
    std::vector<std::string> kem_algorithms;
    std::vector<std::string> signature_algorithms;
    std::string output_dir;
    std::string output_file;
    bool include_baselines = false;
    bool list_only = false;
    bool show_help = false;
    LogLevel log_level = LogLevel::INFO;

    // Defaults from BenchmarkParams.hpp
    BenchmarkConfig();

    // All KEMs first, then all signatures, each in configuration order.
    // Baselines, when enabled, follow the PQC targets of their category.
    std::vector<BenchmarkTarget> Targets() const;
};

// args[0] is the program name. Throws std::invalid_argument on bad usage.
BenchmarkConfig ParseArgs(const std::vector<std::string>& args);

// Comma-separated list; empty items are dropped
std::vector<std::string> SplitList(const std::string& value);

void PrintUsage(std::ostream& os, const std::string& program);

} // namespace pqc_bench
