// =================================================================
// include/GitCC/Logger.hpp
// =================================================================
// Header for diagnostic logging.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <memory>

namespace GitCC {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide diagnostic logger
 *
 * Console output goes to stderr so that stdout stays free for the
 * output of git itself. An optional log file receives every level.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    LogLevel getConsoleLogLevel() const;

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    /**
     * @brief Append all log entries to a file
     * @param file_path Path of the log file, empty to disable
     * @return True if the file could be opened
     */
    bool setLogFile(const std::string& file_path);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Flush all log buffers
     */
    void flush();

    /**
     * @brief Get log level name as string
     * @param level Log level
     * @return String representation
     */
    static std::string getLevelName(LogLevel level);

    /**
     * @brief Get log level color for console output
     * @param level Log level
     * @return ANSI color code
     */
    static std::string getLevelColor(LogLevel level);

private:
    Logger();
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel m_console_level;
    bool m_console_enabled;
    bool m_color_enabled;

    std::unique_ptr<std::ofstream> m_log_file;
    std::string m_log_filename;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param for_file File entries carry a timestamp, console entries a color
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool for_file) const;

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point) const;
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    GitCC::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    GitCC::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    GitCC::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    GitCC::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    GitCC::Logger::getInstance().critical(component, message)

} // namespace GitCC
