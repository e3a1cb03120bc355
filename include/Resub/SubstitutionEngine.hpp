// =================================================================
// include/Resub/SubstitutionEngine.hpp
// =================================================================
// Header for regex matching and template substitution.

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace re2 {
class RE2;
}

namespace Resub {

/**
 * @brief One match found in a file, for reporting only
 *
 * `after` is the replacement applied to `before` on its own, not a slice
 * of the substituted file content.
 */
struct MatchRecord {
    std::string before;
    std::string after;
};

/**
 * @brief Outcome of running the engine over one file's content
 */
struct SubstitutionResult {
    std::vector<MatchRecord> matches;
    std::string new_content;

    bool hasMatches() const { return !matches.empty(); }
};

/**
 * @brief Byte range of one capture group inside the searched text
 */
struct GroupSpan {
    bool matched = false;
    size_t begin = 0;
    size_t end = 0;
};

/**
 * @brief A user pattern rewritten into RE2 syntax
 */
struct PatternTranslation {
    std::string source;                          ///< Pattern handed to RE2
    size_t group_count = 0;                      ///< Groups the user wrote
    std::map<std::string, size_t> group_names;   ///< Named groups, user numbering
    std::vector<int> group_slots;                ///< RE2 capture index per user group (index 0 unused)
    std::vector<int> line_end_slots;             ///< RE2 captures holding a newline eaten by `$`
};

/**
 * @brief A parsed replacement template
 *
 * Understands `\1`..`\99`, `\g<N>`, `\g<name>`, the character escapes
 * `\n \t \r \f \v \a \b \\` and octal escapes. Any other escaped ASCII
 * letter is rejected; other escaped characters are kept with their
 * backslash.
 */
class ReplacementTemplate {
public:
    /**
     * @brief Parse a template against a compiled pattern's groups
     * @param source Template text
     * @param group_count Number of capture groups in the pattern
     * @param group_names Named groups and their indices
     * @return Parsed template
     * @throws ConfigurationError on bad escapes or unknown groups
     */
    static ReplacementTemplate parse(const std::string& source,
                                     size_t group_count,
                                     const std::map<std::string, size_t>& group_names);

    /**
     * @brief Build the replacement text for one match
     * @param text Text the match was found in
     * @param groups Group 0 and every user group, in user numbering
     * @return Replacement text; unmatched groups expand to ""
     */
    std::string expand(const std::string& text, const std::vector<GroupSpan>& groups) const;

    const std::string& source() const { return m_source; }

private:
    struct Segment {
        bool is_group;
        size_t group;
        std::string literal;
    };

    std::string m_source;
    std::vector<Segment> m_segments;

    void appendLiteral(const std::string& text);
    void appendGroup(size_t group);
};

/**
 * @brief Compiled pattern plus replacement template
 *
 * Compilation happens once in the constructor; a bad pattern or template
 * is reported there, before any file is read.
 *
 * Matching is done by RE2 on UTF-8 text, one code point at a time, in
 * time linear in the input. Patterns are written in Python syntax and
 * rewritten for RE2:
 * - `\d`, `\w`, `\s` and their negations match Unicode characters
 *   (unless the `(?a)` flag is given)
 * - `$` also matches before a newline that ends the text, and `\Z` only
 *   at the very end
 * - `\uXXXX` and `\UXXXXXXXX` escapes are accepted
 *
 * Backreferences and lookaround assertions are rejected.
 */
class SubstitutionEngine {
public:
    /**
     * @brief Compile the engine
     * @param pattern Regular expression
     * @param replacement Replacement template
     * @throws ConfigurationError if either does not compile
     */
    SubstitutionEngine(const std::string& pattern, const std::string& replacement);

    /**
     * @brief Find every match and compute the substituted content
     * @param content Full file text (UTF-8)
     * @return Match records and new content; content is returned unchanged
     *         with no records when nothing matches
     */
    SubstitutionResult process(const std::string& content) const;

    /**
     * @brief Replace every match in text
     * @param text Input text (UTF-8)
     * @return Substituted text
     */
    std::string substitute(const std::string& text) const;

    const std::string& pattern() const { return m_pattern_source; }
    const std::string& replacement() const { return m_template.source(); }
    size_t groupCount() const { return m_translation.group_count; }

    /**
     * @brief Rewrite Python-style pattern syntax into RE2 syntax
     * @param pattern Source pattern
     * @return Translated pattern and its group layout
     * @throws ConfigurationError on constructs RE2 cannot express
     */
    static PatternTranslation translatePattern(const std::string& pattern);

private:
    std::string m_pattern_source;
    PatternTranslation m_translation;
    std::shared_ptr<const re2::RE2> m_regex;
    ReplacementTemplate m_template;

    std::string substituteAll(const std::string& text, std::vector<MatchRecord>* records) const;
};

} // namespace Resub
