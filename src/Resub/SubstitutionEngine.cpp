// =================================================================
// src/Resub/SubstitutionEngine.cpp
// =================================================================
// Implementation for regex matching and template substitution.

#include "Resub/SubstitutionEngine.hpp"
#include "Resub/Errors.hpp"
#include "Resub/TextCodec.hpp"
#include <re2/re2.h>
#include <algorithm>

namespace Resub {

namespace {

bool isOctal(char c) {
    return c >= '0' && c <= '7';
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isAsciiLetter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isValidGroupName(const std::string& name) {
    if (name.empty() || isDigit(name[0])) {
        return false;
    }
    for (char c : name) {
        if (!(isAsciiLetter(c) || isDigit(c) || c == '_')) {
            return false;
        }
    }
    return true;
}

bool isHexDigit(char c) {
    return isDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

ConfigurationError patternError(const std::string& pattern, const std::string& message) {
    return ConfigurationError("Invalid regex pattern '" + pattern + "': " + message);
}

// Members of the \d, \w and \s classes, usable inside [...]
std::string shorthandMembers(char shorthand, bool ascii) {
    switch (shorthand) {
        case 'd': return ascii ? "0-9" : "\\p{Nd}";
        case 'w': return ascii ? "0-9A-Za-z_" : "\\p{L}\\p{N}_";
        default:  return ascii ? "\\s\\x0B" : "\\s\\x0B\\x1C-\\x1F\\x{85}\\p{Z}";
    }
}

std::shared_ptr<const re2::RE2> compileRegex(const PatternTranslation& translation, const std::string& original) {
    re2::RE2::Options options;
    options.set_log_errors(false);

    auto regex = std::make_shared<const re2::RE2>(translation.source, options);
    if (!regex->ok()) {
        throw patternError(original, regex->error());
    }
    return regex;
}

size_t codePointLength(const std::string& text, size_t pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    size_t length = 1;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
    }
    return std::min(length, text.size() - pos);
}

// Map RE2 capture slots back to user group numbering. A newline swallowed
// by a translated `$` is given back, so no group ends past it.
void collectGroups(const PatternTranslation& translation, const std::string& text,
                   const std::vector<re2::StringPiece>& slots, std::vector<GroupSpan>& groups) {
    for (size_t g = 0; g < groups.size(); ++g) {
        const re2::StringPiece& piece = slots[g == 0 ? 0 : static_cast<size_t>(translation.group_slots[g])];
        GroupSpan& span = groups[g];
        span.matched = piece.data() != nullptr;
        span.begin = span.matched ? static_cast<size_t>(piece.data() - text.data()) : 0;
        span.end = span.matched ? span.begin + piece.size() : 0;
    }

    bool ate_newline = false;
    for (int slot : translation.line_end_slots) {
        if (slots[static_cast<size_t>(slot)].data() != nullptr) {
            ate_newline = true;
        }
    }
    if (!ate_newline) {
        return;
    }
    for (auto& span : groups) {
        if (span.matched && span.end == text.size()) {
            --span.end;
            span.begin = std::min(span.begin, span.end);
        }
    }
}

ConfigurationError templateError(const std::string& message, size_t position) {
    return ConfigurationError("Invalid replacement template: " + message +
                              " at position " + std::to_string(position));
}

} // namespace

// ReplacementTemplate implementation

ReplacementTemplate ReplacementTemplate::parse(const std::string& source,
                                               size_t group_count,
                                               const std::map<std::string, size_t>& group_names) {
    ReplacementTemplate result;
    result.m_source = source;

    const size_t n = source.size();
    std::string literal;
    size_t i = 0;

    auto flushLiteral = [&]() {
        if (!literal.empty()) {
            result.appendLiteral(literal);
            literal.clear();
        }
    };

    auto checkGroup = [&](size_t group, size_t position) {
        if (group > group_count) {
            throw templateError("invalid group reference " + std::to_string(group), position);
        }
    };

    while (i < n) {
        char c = source[i];
        if (c != '\\') {
            literal += c;
            ++i;
            continue;
        }

        const size_t escape_pos = i;
        if (i + 1 >= n) {
            throw templateError("bad escape (end of template)", escape_pos);
        }

        char d = source[i + 1];
        i += 2;

        if (d == 'g') {
            if (i >= n || source[i] != '<') {
                throw templateError("missing <", i);
            }
            size_t close = source.find('>', i + 1);
            if (close == std::string::npos) {
                throw templateError("missing >, unterminated name", i + 1);
            }
            std::string name = source.substr(i + 1, close - i - 1);
            if (name.empty()) {
                throw templateError("missing group name", i + 1);
            }

            size_t group = 0;
            bool numeric = true;
            for (char ch : name) {
                if (!isDigit(ch)) {
                    numeric = false;
                    break;
                }
            }

            if (numeric) {
                if (name.size() > 9) {
                    throw templateError("invalid group reference " + name, i + 1);
                }
                group = std::stoul(name);
                checkGroup(group, i + 1);
            } else {
                auto it = group_names.find(name);
                if (it == group_names.end()) {
                    throw templateError("unknown group name '" + name + "'", i + 1);
                }
                group = it->second;
            }

            flushLiteral();
            result.appendGroup(group);
            i = close + 1;
        } else if (d == '0') {
            // \0, \0N, \0NN: octal character code
            uint32_t value = 0;
            for (int count = 0; count < 2 && i < n && isOctal(source[i]); ++count, ++i) {
                value = value * 8 + static_cast<uint32_t>(source[i] - '0');
            }
            appendUtf8(literal, value);
        } else if (isDigit(d)) {
            if (i < n && isDigit(source[i])) {
                if (isOctal(d) && isOctal(source[i]) && i + 1 < n && isOctal(source[i + 1])) {
                    uint32_t value = static_cast<uint32_t>(d - '0') * 64 +
                                     static_cast<uint32_t>(source[i] - '0') * 8 +
                                     static_cast<uint32_t>(source[i + 1] - '0');
                    if (value > 0377) {
                        throw templateError("octal escape value outside of range 0-0o377", escape_pos);
                    }
                    appendUtf8(literal, value);
                    i += 2;
                    continue;
                }

                size_t group = static_cast<size_t>(d - '0') * 10 + static_cast<size_t>(source[i] - '0');
                ++i;
                checkGroup(group, escape_pos + 1);
                flushLiteral();
                result.appendGroup(group);
            } else {
                size_t group = static_cast<size_t>(d - '0');
                checkGroup(group, escape_pos + 1);
                flushLiteral();
                result.appendGroup(group);
            }
        } else {
            switch (d) {
                case 'n': literal += '\n'; break;
                case 't': literal += '\t'; break;
                case 'r': literal += '\r'; break;
                case 'f': literal += '\f'; break;
                case 'v': literal += '\v'; break;
                case 'a': literal += '\a'; break;
                case 'b': literal += '\b'; break;
                case '\\': literal += '\\'; break;
                default:
                    if (isAsciiLetter(d)) {
                        throw templateError(std::string("bad escape \\") + d, escape_pos);
                    }
                    literal += '\\';
                    literal += d;
                    break;
            }
        }
    }

    flushLiteral();
    return result;
}

std::string ReplacementTemplate::expand(const std::string& text, const std::vector<GroupSpan>& groups) const {
    std::string out;
    for (const auto& segment : m_segments) {
        if (!segment.is_group) {
            out += segment.literal;
        } else if (segment.group < groups.size() && groups[segment.group].matched) {
            const GroupSpan& span = groups[segment.group];
            out.append(text, span.begin, span.end - span.begin);
        }
    }
    return out;
}

void ReplacementTemplate::appendLiteral(const std::string& text) {
    m_segments.push_back({false, 0, text});
}

void ReplacementTemplate::appendGroup(size_t group) {
    m_segments.push_back({true, group, std::string()});
}

// SubstitutionEngine implementation

SubstitutionEngine::SubstitutionEngine(const std::string& pattern, const std::string& replacement)
    : m_pattern_source(pattern),
      m_translation(translatePattern(pattern)),
      m_regex(compileRegex(m_translation, pattern)),
      m_template(ReplacementTemplate::parse(replacement, m_translation.group_count, m_translation.group_names))
{
}

SubstitutionResult SubstitutionEngine::process(const std::string& content) const {
    SubstitutionResult result;
    result.new_content = substituteAll(content, &result.matches);

    // Each record's replacement is recomputed from the matched text alone
    for (auto& record : result.matches) {
        record.after = substitute(record.before);
    }

    return result;
}

std::string SubstitutionEngine::substitute(const std::string& text) const {
    return substituteAll(text, nullptr);
}

std::string SubstitutionEngine::substituteAll(const std::string& text,
                                              std::vector<MatchRecord>* records) const {
    const re2::StringPiece subject(text);
    const int slot_count = m_regex->NumberOfCapturingGroups() + 1;
    std::vector<re2::StringPiece> slots(static_cast<size_t>(slot_count));
    std::vector<GroupSpan> groups(m_translation.group_count + 1);

    std::string out;
    bool found = false;
    size_t last = 0;
    size_t pos = 0;

    while (pos <= text.size() &&
           m_regex->Match(subject, pos, text.size(), re2::RE2::UNANCHORED, slots.data(), slot_count)) {
        collectGroups(m_translation, text, slots, groups);
        const GroupSpan& whole = groups[0];

        if (!found) {
            out.reserve(text.size());
            found = true;
        }
        out.append(text, last, whole.begin - last);
        out += m_template.expand(text, groups);
        last = whole.end;

        if (records) {
            records->push_back({text.substr(whole.begin, whole.end - whole.begin), std::string()});
        }

        // An empty match may follow a non-empty one, but never repeats in place
        if (whole.end > whole.begin) {
            pos = whole.end;
        } else if (whole.end < text.size()) {
            pos = whole.end + codePointLength(text, whole.end);
        } else {
            break;
        }
    }

    if (!found) {
        return text;
    }
    out.append(text, last, std::string::npos);
    return out;
}

PatternTranslation SubstitutionEngine::translatePattern(const std::string& pattern) {
    PatternTranslation result;
    result.group_slots.push_back(0);
    std::string& out = result.source;
    out.reserve(pattern.size() + 16);

    const size_t n = pattern.size();
    int slot = 0;
    bool ascii = false;
    bool multiline = false;
    bool in_class = false;
    size_t i = 0;

    // Global flags: (?aimsu) at the start of the pattern
    while (i + 2 < n && pattern[i] == '(' && pattern[i + 1] == '?' && isAsciiLetter(pattern[i + 2])) {
        size_t close = i + 2;
        while (close < n && isAsciiLetter(pattern[close])) {
            ++close;
        }
        if (close >= n || pattern[close] != ')') {
            break;
        }

        std::string kept;
        for (size_t k = i + 2; k < close; ++k) {
            switch (pattern[k]) {
                case 'i': case 's': kept += pattern[k]; break;
                case 'm': kept += 'm'; multiline = true; break;
                case 'a': ascii = true; break;
                case 'u': break;
                default:
                    throw patternError(pattern, std::string("unsupported flag '") + pattern[k] + "'");
            }
        }
        if (!kept.empty()) {
            out += "(?" + kept + ")";
        }
        i = close + 1;
    }

    while (i < n) {
        char c = pattern[i];

        if (c == '\\') {
            if (i + 1 >= n) {
                // Let RE2 report the dangling escape
                out += c;
                ++i;
                continue;
            }
            char d = pattern[i + 1];
            i += 2;

            if (d >= '1' && d <= '9') {
                throw patternError(pattern, "backreferences are not supported");
            }

            switch (d) {
                case 'Z':
                    out += in_class ? "\\Z" : "\\z";
                    break;
                case 'b':
                    out += in_class ? "\\x08" : "\\b";
                    break;
                case 'd': case 'w': case 's':
                    out += in_class ? shorthandMembers(d, ascii) : "[" + shorthandMembers(d, ascii) + "]";
                    break;
                case 'D': case 'W': case 'S': {
                    const char lower = static_cast<char>(d - 'A' + 'a');
                    if (!in_class) {
                        out += "[^" + shorthandMembers(lower, ascii) + "]";
                    } else if (d == 'D' && !ascii) {
                        out += "\\P{Nd}";
                    } else {
                        out += '\\';
                        out += d;
                    }
                    break;
                }
                case 'u': case 'U': {
                    const size_t digits = d == 'u' ? 4 : 8;
                    if (i + digits > n) {
                        throw patternError(pattern, std::string("incomplete escape \\") + d);
                    }
                    for (size_t k = i; k < i + digits; ++k) {
                        if (!isHexDigit(pattern[k])) {
                            throw patternError(pattern, std::string("incomplete escape \\") + d);
                        }
                    }
                    out += "\\x{" + pattern.substr(i, digits) + "}";
                    i += digits;
                    break;
                }
                default:
                    out += '\\';
                    out += d;
                    break;
            }
            continue;
        }

        if (in_class) {
            if (c == ']') {
                in_class = false;
            }
            out += c;
            ++i;
            continue;
        }

        if (c == '[') {
            in_class = true;
            out += c;
            ++i;
            if (i < n && pattern[i] == '^') {
                out += '^';
                ++i;
            }
            // A leading ']' is a literal member of the set
            if (i < n && pattern[i] == ']') {
                out += "\\]";
                ++i;
            }
            continue;
        }

        if (c == '$' && !multiline) {
            // End of text, or before a newline that ends the text
            out += "(?:\\z|(\\n)\\z)";
            result.line_end_slots.push_back(++slot);
            ++i;
            continue;
        }

        if (c == '(') {
            if (pattern.compare(i, 4, "(?P<") == 0) {
                size_t close = pattern.find('>', i + 4);
                if (close == std::string::npos) {
                    throw patternError(pattern, "unterminated group name");
                }
                std::string name = pattern.substr(i + 4, close - i - 4);
                if (!isValidGroupName(name)) {
                    throw patternError(pattern, "bad group name '" + name + "'");
                }
                if (result.group_names.count(name)) {
                    throw patternError(pattern, "redefinition of group name '" + name + "'");
                }
                result.group_names[name] = ++result.group_count;
                result.group_slots.push_back(++slot);
                out += "(?P<" + name + ">";
                i = close + 1;
                continue;
            }

            if (pattern.compare(i, 4, "(?P=") == 0) {
                throw patternError(pattern, "backreferences are not supported");
            }

            if (pattern.compare(i, 3, "(?=") == 0 || pattern.compare(i, 3, "(?!") == 0 ||
                pattern.compare(i, 4, "(?<=") == 0 || pattern.compare(i, 4, "(?<!") == 0) {
                throw patternError(pattern, "lookaround assertions are not supported");
            }

            if (pattern.compare(i, 3, "(?#") == 0) {
                size_t close = pattern.find(')', i + 3);
                if (close == std::string::npos) {
                    throw patternError(pattern, "missing ), unterminated comment");
                }
                i = close + 1;
                continue;
            }

            if (i + 1 >= n || pattern[i + 1] != '?') {
                ++result.group_count;
                result.group_slots.push_back(++slot);
            }
        }

        out += c;
        ++i;
    }

    return result;
}

} // namespace Resub
