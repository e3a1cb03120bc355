// =================================================================
// src/Resub/Logger.cpp
// =================================================================
// Implementation for diagnostic logging.

#include "Resub/Logger.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace Resub {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_file) {
    m_initialized = true;
    m_log_file.reset();
    m_log_filename = log_file;

    if (!log_file.empty()) {
        m_log_file = std::make_unique<std::ofstream>(log_file, std::ios::app);
        if (!m_log_file->is_open()) {
            std::cerr << "[WARN] Cannot open diagnostic log file: " << log_file << std::endl;
            m_log_file.reset();
        }
    }

    debug("Logger", "Logging system initialized", m_log_filename.empty() ? "console only" : m_log_filename);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
}

void Logger::setConsoleColor(bool enabled) {
    m_console_color = enabled;
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

void Logger::logRunStart(const std::string& target, const std::string& pattern, bool dry_run) {
    std::ostringstream context;
    context << "Target: " << target << ", ";
    context << "Pattern: " << pattern << ", ";
    context << "Mode: " << (dry_run ? "dry run" : "write");

    info("Run", "Run started", context.str());
}

void Logger::logRunEnd(size_t files_modified, size_t replacements, long duration_ms) {
    std::ostringstream context;
    context << "Files modified: " << files_modified << ", ";
    context << "Replacements: " << replacements << ", ";
    context << "Duration: " << duration_ms << "ms";

    info("Run", "Run completed", context.str());
}

void Logger::flush() {
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
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    if (!m_initialized) {
        initialize();
    }

    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (entry.level < m_console_level) {
        return;
    }

    std::cerr << formatEntry(entry, m_console_color) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_log_file || entry.level < m_file_level) {
        return;
    }

    *m_log_file << formatEntry(entry, false) << '\n';

    // Flush errors immediately so they survive an abort
    if (entry.level >= LogLevel::ERROR) {
        m_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) const {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m";
    }
    formatted << " ";

    formatted << entry.component << ": " << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

} // namespace Resub
