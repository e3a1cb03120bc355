// =================================================================
// src/Resub/RunLog.cpp
// =================================================================
// Implementation for the replacement log.

#include "Resub/RunLog.hpp"
#include "Resub/Logger.hpp"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace Resub {

RunLog::RunLog(const std::string& destination)
    : m_destination(destination)
{
}

void RunLog::record(const std::string& file_path, const std::string& before, const std::string& after) {
    std::ostringstream entry;
    entry << "[" << formatTimestamp(std::chrono::system_clock::now()) << "] File: " << file_path << "\n";
    entry << "    Replaced: " << before << " -> " << after << "\n";
    m_entries.push_back(entry.str());
}

std::string RunLog::finalize(const RunStatistics& stats) {
    std::string summary = formatSummary(stats, m_destination);
    m_entries.push_back(summary);
    return summary;
}

bool RunLog::flush() const {
    namespace fs = std::filesystem;

    const std::string temp_path = m_destination + ".tmp";
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            Logger::getInstance().error("RunLog", "Cannot open log file for writing", temp_path);
            return false;
        }
        const std::string text = contents();
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.flush();
        if (!out.good()) {
            Logger::getInstance().error("RunLog", "Failed writing log file", temp_path);
            out.close();
            std::error_code ignored;
            fs::remove(temp_path, ignored);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temp_path, m_destination, ec);
    if (ec) {
        Logger::getInstance().error("RunLog", "Cannot move log into place: " + m_destination, ec.message());
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        return false;
    }

    RESUB_LOG_DEBUG("RunLog", "Wrote " + std::to_string(m_entries.size()) + " entries to " + m_destination);
    return true;
}

std::string RunLog::contents() const {
    std::string text;
    for (const auto& entry : m_entries) {
        text += entry;
    }
    return text;
}

std::string RunLog::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        time_point.time_since_epoch()) % 1000000;
    if (us.count() < 0) {
        us += std::chrono::seconds(1);
    }

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%dT%H:%M:%S");
    if (us.count() != 0) {
        oss << "." << std::setfill('0') << std::setw(6) << us.count();
    }
    return oss.str();
}

std::string RunLog::formatSummary(const RunStatistics& stats, const std::string& destination) {
    std::ostringstream summary;
    summary << "\n=== SUMMARY ===\n";
    summary << "Files modified:    " << stats.files_modified << "\n";
    summary << "Replacements made: " << stats.total_replacements << "\n";
    summary << "Log saved to:      " << destination << "\n";
    return summary.str();
}

} // namespace Resub
