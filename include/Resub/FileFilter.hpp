// =================================================================
// include/Resub/FileFilter.hpp
// =================================================================
// Header for shell-style filename glob matching.

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace re2 {
class RE2;
}

namespace Resub {

/**
 * @brief Case-sensitive shell wildcard pattern
 *
 * Supports the classic filename wildcards:
 * - `*` matches any run of characters (including none)
 * - `?` matches exactly one character
 * - `[seq]` matches one character in seq, `[!seq]` one character not in seq
 *
 * Characters are code points: a filename that is not valid UTF-8 is read
 * as Latin-1 before matching. An unterminated `[` is taken literally. The
 * whole filename must match.
 */
class GlobPattern {
public:
    /**
     * @brief Compile a glob into its regex equivalent
     * @param pattern The glob string
     * @throws ConfigurationError if the glob yields an invalid set (e.g. `[z-a]`)
     */
    explicit GlobPattern(const std::string& pattern);

    /**
     * @brief Check whether a bare filename matches the glob
     * @param filename Filename without directory components
     * @return true if the whole filename matches
     */
    bool matches(const std::string& filename) const;

    const std::string& getPattern() const { return m_original_pattern; }

    /**
     * @brief Translate a glob into an RE2 regex body
     * @param glob_pattern Glob string
     * @return Regex source matching exactly the same names
     */
    static std::string globToRegex(const std::string& glob_pattern);

private:
    std::string m_original_pattern;
    std::shared_ptr<const re2::RE2> m_regex;
};

/**
 * @brief Include/exclude decision for filenames found by a directory walk
 *
 * A filename passes when it matches at least one include glob and none of
 * the exclude globs. An empty include list behaves like `*`.
 */
class FileFilter {
public:
    FileFilter();

    FileFilter(const std::vector<std::string>& include_patterns,
               const std::vector<std::string>& exclude_patterns);

    /**
     * @brief Decide whether a filename should be processed
     * @param filename Bare filename (no directory part)
     * @return true if included and not excluded
     */
    bool isIncluded(const std::string& filename) const;

    size_t includeCount() const { return m_include.size(); }
    size_t excludeCount() const { return m_exclude.size(); }

private:
    std::vector<GlobPattern> m_include;
    std::vector<GlobPattern> m_exclude;
};

} // namespace Resub
