#pragma once

#include "Aggregator.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace pqc_bench {

constexpr const char* NOT_APPLICABLE = "N/A";

class ReportWriter {
public:
    ReportWriter(std::filesystem::path output_dir, std::string file_name);

    // Creates the output directory if needed and overwrites the CSV file.
    // Returns false, and touches nothing, when there are no results.
    // Throws ReportError on I/O failure.
    bool Save(const std::vector<BenchmarkResult>& results) const;

    std::filesystem::path OutputPath() const { return m_output_dir / m_file_name; }

    static void WriteCsv(std::ostream& os, const std::vector<BenchmarkResult>& results);
    static void PrintSummary(std::ostream& os, const std::vector<BenchmarkResult>& results);

    // Shortest decimal that round-trips the value. Fixed notation (with at least one
    // fractional digit) for decimal exponents -4..15, scientific otherwise.
    static std::string FormatMs(double value);

private:
    std::filesystem::path m_output_dir;
    std::string m_file_name;
};

} // namespace pqc_bench
