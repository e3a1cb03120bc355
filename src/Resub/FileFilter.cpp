// =================================================================
// src/Resub/FileFilter.cpp
// =================================================================
// Implementation for shell-style filename glob matching.

#include "Resub/FileFilter.hpp"
#include "Resub/Errors.hpp"
#include "Resub/TextCodec.hpp"
#include <re2/re2.h>
#include <algorithm>

namespace Resub {

namespace {

bool isRegexSpecial(char c) {
    switch (c) {
        case '.': case '^': case '$': case '+': case '*': case '?':
        case '(': case ')': case '[': case ']': case '{': case '}':
        case '|': case '\\':
            return true;
        default:
            return false;
    }
}

} // namespace

GlobPattern::GlobPattern(const std::string& pattern)
    : m_original_pattern(pattern)
{
    re2::RE2::Options options;
    options.set_log_errors(false);

    m_regex = std::make_shared<const re2::RE2>(globToRegex(pattern), options);
    if (!m_regex->ok()) {
        throw ConfigurationError("Invalid file pattern '" + pattern + "': " + m_regex->error());
    }
}

bool GlobPattern::matches(const std::string& filename) const {
    if (Utf8Decoder().decode(filename)) {
        return re2::RE2::FullMatch(filename, *m_regex);
    }

    auto text = Latin1Decoder().decode(filename);
    return text && re2::RE2::FullMatch(*text, *m_regex);
}

std::string GlobPattern::globToRegex(const std::string& glob_pattern) {
    std::string regex_pattern;
    const size_t n = glob_pattern.length();
    size_t i = 0;

    while (i < n) {
        char c = glob_pattern[i++];

        switch (c) {
            case '*':
                // Collapse runs of * into a single wildcard
                while (i < n && glob_pattern[i] == '*') {
                    ++i;
                }
                regex_pattern += "(?s:.*)";
                break;

            case '?':
                regex_pattern += "(?s:.)";
                break;

            case '[': {
                size_t j = i;
                if (j < n && glob_pattern[j] == '!') {
                    ++j;
                }
                if (j < n && glob_pattern[j] == ']') {
                    ++j;
                }
                while (j < n && glob_pattern[j] != ']') {
                    ++j;
                }

                if (j >= n) {
                    // No closing bracket: literal '['
                    regex_pattern += "\\[";
                    break;
                }

                std::string set = glob_pattern.substr(i, j - i);
                i = j + 1;

                std::string body;
                size_t k = 0;
                if (!set.empty() && set[0] == '!') {
                    body += '^';
                    k = 1;
                } else if (!set.empty() && set[0] == '^') {
                    body += "\\^";
                    k = 1;
                }
                for (; k < set.size(); ++k) {
                    char s = set[k];
                    if (s == '\\' || s == '[' || s == ']') {
                        body += '\\';
                    }
                    body += s;
                }
                regex_pattern += "[" + body + "]";
                break;
            }

            default:
                if (isRegexSpecial(c)) {
                    regex_pattern += '\\';
                }
                regex_pattern += c;
                break;
        }
    }

    return regex_pattern;
}

// FileFilter implementation

FileFilter::FileFilter()
    : FileFilter({}, {})
{
}

FileFilter::FileFilter(const std::vector<std::string>& include_patterns,
                       const std::vector<std::string>& exclude_patterns) {
    for (const auto& pattern : include_patterns) {
        m_include.emplace_back(pattern);
    }
    if (m_include.empty()) {
        m_include.emplace_back("*");
    }

    for (const auto& pattern : exclude_patterns) {
        m_exclude.emplace_back(pattern);
    }
}

bool FileFilter::isIncluded(const std::string& filename) const {
    auto matches = [&filename](const GlobPattern& glob) { return glob.matches(filename); };

    bool included = std::any_of(m_include.begin(), m_include.end(), matches);
    bool excluded = std::any_of(m_exclude.begin(), m_exclude.end(), matches);

    return included && !excluded;
}

} // namespace Resub
