// =================================================================
// src/GitCC/Logger.cpp
// =================================================================
// Implementation for diagnostic logging.

#include "GitCC/Logger.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <unistd.h>

namespace GitCC {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : m_console_level(LogLevel::INFO),
      m_console_enabled(true),
      m_color_enabled(isatty(STDERR_FILENO) != 0) {}

Logger::~Logger() {
    flush();
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
}

LogLevel Logger::getConsoleLogLevel() const {
    return m_console_level;
}

void Logger::setConsoleLogging(bool enabled) {
    m_console_enabled = enabled;
}

bool Logger::setLogFile(const std::string& file_path) {
    m_log_file.reset();
    m_log_filename = file_path;
    if (file_path.empty()) {
        return true;
    }

    auto file = std::make_unique<std::ofstream>(file_path, std::ios::app);
    if (!file->is_open()) {
        m_log_filename.clear();
        warning("Logger", "Cannot open log file", file_path);
        return false;
    }
    m_log_file = std::move(file);
    return true;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::flush() {
    std::cerr.flush();
    if (m_log_file && m_log_file->is_open()) {
        m_log_file->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    std::cerr << formatEntry(entry, false) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_log_file) {
        return;
    }

    *m_log_file << formatEntry(entry, true) << '\n';

    // Flush errors immediately, the process may exit right after
    if (entry.level >= LogLevel::ERROR) {
        m_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool for_file) const {
    std::ostringstream formatted;
    bool include_color = !for_file && m_color_enabled;

    if (for_file) {
        formatted << formatTimestamp(entry.timestamp) << " ";
    }

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m";
    }
    formatted << " ";

    if (for_file || entry.level == LogLevel::DEBUG) {
        formatted << entry.component << ": ";
    }

    formatted << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) const {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

} // namespace GitCC
