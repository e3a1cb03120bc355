// =================================================================
// include/Resub/ConsoleReporter.hpp
// =================================================================
// Per-file console narration and the final summary.

#pragma once

#include "Resub/SubstitutionEngine.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace Resub {

class ConsoleReporter {
public:
    /**
     * @param out Destination stream (stdout in the tool)
     * @param color Emit ANSI colors
     * @param summary_only Suppress everything except the summary
     * @param show_diff Print a line diff for files that change
     */
    ConsoleReporter(std::ostream& out, bool color, bool summary_only, bool show_diff);

    void fileSkipped(const std::string& file_path);
    void fileWouldModify(const std::string& file_path, const std::vector<MatchRecord>& matches);
    void fileModified(const std::string& file_path);

    /**
     * @brief Print removed and added lines between two versions of a file
     */
    void fileDiff(const std::string& original, const std::string& modified);

    /**
     * @brief Print the summary block; never suppressed
     */
    void summary(const std::string& summary_text);

    /**
     * @brief Check if stdout is a terminal
     */
    static bool supportsColor();

private:
    std::ostream& m_out;
    bool m_color;
    bool m_summary_only;
    bool m_show_diff;

    void printColor(const std::string& text, const char* color);
};

} // namespace Resub
