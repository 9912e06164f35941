#pragma once

#include <stdexcept>
#include <string>

namespace pqc_bench {

// Root of every error the benchmark raises on purpose.
class BenchmarkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The provider knows the mechanism but the linked build has it disabled.
// The run controller skips the target and continues.
class MechanismNotEnabledError : public BenchmarkError {
public:
    explicit MechanismNotEnabledError(const std::string& name)
        : BenchmarkError("Mechanism " + name + " is not enabled"), m_name(name) {}

    const std::string& Name() const { return m_name; }

private:
    std::string m_name;
};

// The provider does not know the mechanism at all.
class MechanismNotSupportedError : public BenchmarkError {
public:
    explicit MechanismNotSupportedError(const std::string& name)
        : BenchmarkError("Mechanism " + name + " is not supported"), m_name(name) {}

    const std::string& Name() const { return m_name; }

private:
    std::string m_name;
};

// Shared secrets disagree or a signature fails to verify.
class CorrectnessError : public BenchmarkError {
public:
    using BenchmarkError::BenchmarkError;
};

// A provider call reported failure.
class LibraryError : public BenchmarkError {
public:
    using BenchmarkError::BenchmarkError;
};

// The report could not be written.
class ReportError : public BenchmarkError {
public:
    using BenchmarkError::BenchmarkError;
};

} // namespace pqc_bench
