// =================================================================
// include/Resub/Logger.hpp
// =================================================================
// Header for diagnostic logging.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <memory>

namespace Resub {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR       ///< Error conditions
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
 * Diagnostics go to stderr, filtered by the console level, and optionally
 * to a file. This is separate from the replacement log kept by RunLog,
 * so stdout stays reserved for the run narration and summary.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger outputs
     * @param log_file File receiving every entry at or above the file level;
     *        empty for console only
     */
    void initialize(const std::string& log_file = "");

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    void setConsoleColor(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log run start
     * @param target Description of the target selection
     * @param pattern Search pattern as given by the user
     * @param dry_run Whether writes are suppressed
     */
    void logRunStart(const std::string& target, const std::string& pattern, bool dry_run);

    /**
     * @brief Log run end
     * @param files_modified Files with at least one match
     * @param replacements Total matches across all files
     * @param duration_ms Run duration in milliseconds
     */
    void logRunEnd(size_t files_modified, size_t replacements, long duration_ms);

    /**
     * @brief Flush the file output, if any
     */
    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel m_console_level = LogLevel::WARNING;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_color = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_log_file;
    std::string m_log_filename;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color) const;

    static std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
};

// Convenience macro for debug tracing
#define RESUB_LOG_DEBUG(component, message) \
    Resub::Logger::getInstance().debug(component, message)

} // namespace Resub
