#pragma once

#include <iostream>
#include <string>

namespace pqc_bench {

enum class LogLevel : int {
    QUIET   = 0,
    ERROR   = 1,
    WARNING = 2,
    INFO    = 3,
    DEBUG   = 4
};

// Console logger. Progress goes to the output stream, errors to the error stream.
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::INFO,
                    std::ostream& out = std::cout,
                    std::ostream& err = std::cerr);

    LogLevel Level() const { return m_level; }
    bool IsEnabled(LogLevel level) const;

    void Error(const std::string& message);
    void Warning(const std::string& message);
    void Info(const std::string& message);
    void Debug(const std::string& message);

    // Single character without newline, flushed immediately (debug only)
    void Progress(char mark);
    void EndProgress();

    std::ostream& Out() { return m_out; }

private:
    LogLevel m_level;
    std::ostream& m_out;
    std::ostream& m_err;
    bool m_progress_pending = false;
};

} // namespace pqc_bench
