#include "Logger.hpp"

namespace pqc_bench {

Logger::Logger(LogLevel level, std::ostream& out, std::ostream& err)
    : m_level(level), m_out(out), m_err(err) {}

bool Logger::IsEnabled(LogLevel level) const {
    return static_cast<int>(m_level) >= static_cast<int>(level);
}

void Logger::Error(const std::string& message) {
    if (!IsEnabled(LogLevel::ERROR)) return;
    EndProgress();
    m_err << message << std::endl;
}

void Logger::Warning(const std::string& message) {
    if (!IsEnabled(LogLevel::WARNING)) return;
    EndProgress();
    m_out << message << std::endl;
}

void Logger::Info(const std::string& message) {
    if (!IsEnabled(LogLevel::INFO)) return;
    EndProgress();
    m_out << message << std::endl;
}

void Logger::Debug(const std::string& message) {
    if (!IsEnabled(LogLevel::DEBUG)) return;
    EndProgress();
    m_out << message << std::endl;
}

void Logger::Progress(char mark) {
    if (!IsEnabled(LogLevel::DEBUG)) return;
    m_out << mark << std::flush;
    m_progress_pending = true;
}

void Logger::EndProgress() {
    if (m_progress_pending) {
        m_out << std::endl;
        m_progress_pending = false;
    }
}

} // namespace pqc_bench
