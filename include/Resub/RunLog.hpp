// =================================================================
// include/Resub/RunLog.hpp
// =================================================================
// Header for the replacement log written at the end of a run.

#pragma once

#include "Resub/RunStatistics.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace Resub {

/**
 * @brief In-memory replacement log, persisted once at the end of a run
 *
 * Each replacement becomes a two-line entry:
 * @code
 * [2024-05-01T10:22:03.412345] File: src/a.txt
 *     Replaced: foo123 -> bar123
 * @endcode
 * followed at the end by the summary block that is also printed on the
 * console.
 */
class RunLog {
public:
    /**
     * @brief Construct an empty log
     * @param destination Path the log will be written to
     */
    explicit RunLog(const std::string& destination);

    /**
     * @brief Append one timestamped replacement entry
     * @param file_path File the replacement belongs to
     * @param before Matched text
     * @param after Replacement text
     */
    void record(const std::string& file_path, const std::string& before, const std::string& after);

    /**
     * @brief Append the summary block
     * @param stats Final run counters
     * @return The summary text, for printing on the console
     */
    std::string finalize(const RunStatistics& stats);

    /**
     * @brief Write the whole log to the destination in one step
     *
     * Content goes to a sibling temporary file that is then renamed over
     * the destination. Failures are reported through the Logger.
     * @return true if the log was persisted
     */
    bool flush() const;

    /**
     * @brief Whole log as it would be written
     */
    std::string contents() const;

    const std::vector<std::string>& entries() const { return m_entries; }
    const std::string& destination() const { return m_destination; }

    /**
     * @brief Format a local time as ISO-8601 with microseconds
     *
     * The fractional part is omitted when it is zero.
     */
    static std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);

    /**
     * @brief Summary block shared by the console and the log file
     */
    static std::string formatSummary(const RunStatistics& stats, const std::string& destination);

private:
    std::string m_destination;
    std::vector<std::string> m_entries;
};

} // namespace Resub
