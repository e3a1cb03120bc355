// =================================================================
// src/Resub/ConsoleReporter.cpp
// =================================================================
// Implementation for console narration.

#include "Resub/ConsoleReporter.hpp"
#include "dtl/dtl.hpp"
#include <cstdio>
#include <sstream>

#if defined(_WIN32)
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace Resub {

namespace {

const char* const COLOR_RESET = "\033[0m";
const char* const COLOR_RED = "\033[31m";
const char* const COLOR_GREEN = "\033[92m";
const char* const COLOR_DIFF_GREEN = "\033[32m";
const char* const COLOR_GRAY = "\033[90m";

std::vector<std::string> toLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream stream(text);
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

ConsoleReporter::ConsoleReporter(std::ostream& out, bool color, bool summary_only, bool show_diff)
    : m_out(out), m_color(color), m_summary_only(summary_only), m_show_diff(show_diff)
{
}

void ConsoleReporter::fileSkipped(const std::string& file_path) {
    if (m_summary_only) {
        return;
    }
    printColor("[Skipped] " + file_path, COLOR_GRAY);
}

void ConsoleReporter::fileWouldModify(const std::string& file_path, const std::vector<MatchRecord>& matches) {
    if (m_summary_only) {
        return;
    }
    printColor("[Dry Run] Would modify: " + file_path, COLOR_GREEN);
    for (const auto& match : matches) {
        m_out << "  Replace: " << match.before << " → " << match.after << "\n";
    }
}

void ConsoleReporter::fileModified(const std::string& file_path) {
    if (m_summary_only) {
        return;
    }
    printColor("[Modified] " + file_path, COLOR_GREEN);
}

void ConsoleReporter::fileDiff(const std::string& original, const std::string& modified) {
    if (m_summary_only || !m_show_diff) {
        return;
    }

    using elem = std::string;
    using sequence = std::vector<elem>;
    dtl::Diff<elem, sequence> differ(toLines(original), toLines(modified));
    differ.compose();

    for (const auto& ses_item : differ.getSes().getSequence()) {
        if (ses_item.second.type == dtl::SES_DELETE) {
            printColor("    - " + ses_item.first, COLOR_RED);
        } else if (ses_item.second.type == dtl::SES_ADD) {
            printColor("    + " + ses_item.first, COLOR_DIFF_GREEN);
        }
    }
}

void ConsoleReporter::summary(const std::string& summary_text) {
    m_out << summary_text << "\n";
    m_out.flush();
}

bool ConsoleReporter::supportsColor() {
    return isatty(fileno(stdout));
}

void ConsoleReporter::printColor(const std::string& text, const char* color) {
    if (m_color) {
        m_out << color << text << COLOR_RESET << "\n";
    } else {
        m_out << text << "\n";
    }
}

} // namespace Resub
