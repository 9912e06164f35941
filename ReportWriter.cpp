#include "ReportWriter.hpp"
#include "Errors.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace pqc_bench {

namespace {

constexpr std::array<const char*, 9> CSV_HEADER = {
    "Algorithm",
    "Type",
    "Public Key (bytes)",
    "Secret Key (bytes)",
    "Ciphertext (bytes)",
    "Signature (bytes)",
    "Keygen (ms)",
    "Encaps/Sign (ms)",
    "Decaps/Verify (ms)",
};

// RFC 4180 line ending
constexpr const char* CSV_EOL = "\r\n";

std::string EscapeField(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string SizeField(const std::optional<size_t>& size) {
    return size ? std::to_string(*size) : NOT_APPLICABLE;
}

std::string FixedMs(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3) << value;
    return ss.str();
}

} // namespace

ReportWriter::ReportWriter(std::filesystem::path output_dir, std::string file_name)
    : m_output_dir(std::move(output_dir)), m_file_name(std::move(file_name)) {}

bool ReportWriter::Save(const std::vector<BenchmarkResult>& results) const {
    if (results.empty()) {
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(m_output_dir, ec);
    if (ec) {
        throw ReportError("Cannot create directory " + m_output_dir.string() + ": " + ec.message());
    }

    const std::filesystem::path path = OutputPath();
    std::ofstream csv(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!csv) {
        throw ReportError("Cannot open " + path.string() + " for writing");
    }

    WriteCsv(csv, results);
    csv.flush();
    if (!csv) {
        throw ReportError("Failed writing " + path.string());
    }
    return true;
}

void ReportWriter::WriteCsv(std::ostream& os, const std::vector<BenchmarkResult>& results) {
    for (size_t i = 0; i < CSV_HEADER.size(); ++i) {
        if (i > 0) os << ',';
        os << CSV_HEADER[i];
    }
    os << CSV_EOL;

    for (const auto& r : results) {
        os << EscapeField(r.algorithm) << ','
           << ToString(r.type) << ','
           << r.public_key_bytes << ','
           << r.secret_key_bytes << ','
           << SizeField(r.ciphertext_bytes) << ','
           << SizeField(r.signature_bytes) << ','
           << FormatMs(r.keygen_ms) << ','
           << FormatMs(r.encaps_sign_ms) << ','
           << FormatMs(r.decaps_verify_ms) << CSV_EOL;
    }
}

void ReportWriter::PrintSummary(std::ostream& os, const std::vector<BenchmarkResult>& results) {
    auto row = [&os](const std::string& algorithm, const std::string& type,
                     const std::string& keygen, const std::string& sign,
                     const std::string& verify, const std::string& sig_size) {
        os << std::left << std::setw(25) << algorithm << " | "
           << std::setw(10) << type << " | "
           << std::right << std::setw(10) << keygen << " | "
           << std::setw(10) << sign << " | "
           << std::setw(10) << verify << " | "
           << std::setw(10) << sig_size << '\n';
    };

    os << "\nBenchmark Summary:\n";
    row("Algorithm", "Type", "Keygen(ms)", "Sign(ms)", "Verify(ms)", "SigSize(B)");
    os << std::string(85, '-') << '\n';
    for (const auto& r : results) {
        row(r.algorithm, ToString(r.type),
            FixedMs(r.keygen_ms), FixedMs(r.encaps_sign_ms), FixedMs(r.decaps_verify_ms),
            SizeField(r.signature_bytes));
    }
    os << std::flush;
}

std::string ReportWriter::FormatMs(double value) {
    // Shortest round-trip digits and decimal exponent, e.g. "1.2345e-04"
    std::array<char, 64> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value,
                                   std::chars_format::scientific);
    if (ec != std::errc()) {
        throw ReportError("Cannot format timing value");
    }
    std::string scientific(buffer.data(), end);
    if (!std::isfinite(value)) {
        return scientific;
    }

    const size_t e_pos = scientific.find('e');
    const int exponent = std::stoi(scientific.substr(e_pos + 1));

    // Fixed notation for exponents in [-4, 16), scientific outside
    if (exponent < -4 || exponent >= 16) {
        return scientific;
    }

    std::string sign;
    std::string digits;
    for (size_t i = 0; i < e_pos; ++i) {
        char c = scientific[i];
        if (c == '-') {
            sign = "-";
        } else if (c != '.') {
            digits += c;
        }
    }

    const int int_digits = exponent + 1;
    const int digit_count = static_cast<int>(digits.size());
    if (int_digits <= 0) {
        return sign + "0." + std::string(-int_digits, '0') + digits;
    }
    if (int_digits >= digit_count) {
        return sign + digits + std::string(int_digits - digit_count, '0') + ".0";
    }
    return sign + digits.substr(0, int_digits) + "." + digits.substr(int_digits);
}

} // namespace pqc_bench
