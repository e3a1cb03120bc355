// =================================================================
// include/Resub/RunStatistics.hpp
// =================================================================
// Per-file outcomes and their aggregate over a run.

#pragma once

#include <string>

namespace Resub {

/**
 * @brief What processing one file produced
 */
struct FileOutcome {
    std::string path;
    size_t replacements = 0;
    bool written = false;       ///< Content was persisted (never in dry run)

    bool matched() const { return replacements > 0; }
};

/**
 * @brief Counters reported in the run summary
 *
 * Built by folding FileOutcome values; files without matches add nothing.
 */
struct RunStatistics {
    size_t files_modified = 0;
    size_t total_replacements = 0;

    void add(const FileOutcome& outcome) {
        if (!outcome.matched()) {
            return;
        }
        ++files_modified;
        total_replacements += outcome.replacements;
    }

    RunStatistics& operator+=(const RunStatistics& other) {
        files_modified += other.files_modified;
        total_replacements += other.total_replacements;
        return *this;
    }
};

} // namespace Resub
