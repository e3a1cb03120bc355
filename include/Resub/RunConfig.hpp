// =================================================================
// include/Resub/RunConfig.hpp
// =================================================================
// Settings for a replacement run: merged from the defaults file and the
// command line, then frozen into an immutable RunConfiguration.

#pragma once

#include "Resub/FileFilter.hpp"
#include "Resub/SubstitutionEngine.hpp"
#include "Resub/TargetEnumerator.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Resub {

/**
 * @brief Mutable settings assembled before a run
 */
struct RunSettings {
    std::optional<TargetSelection> target;
    std::string pattern;
    std::string replacement;

    bool dry_run = false;
    std::string log_path = defaultLogPath();
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
    bool summary_only = false;

    // Presentation
    bool color = true;
    bool show_diff = false;

    /**
     * @brief Load defaults from a configuration file
     * @param config ConfigParser instance
     */
    void loadFromConfig(const class ConfigParser& config);

    /**
     * @brief Apply command-line values on top of the file defaults
     * @param commands Command-line arguments
     */
    void applyCommandOverrides(const struct Commands& commands);

    /**
     * @brief Validate settings that do not need compilation
     * @throws ConfigurationError describing the first problem found
     */
    void validate() const;

    static std::string defaultLogPath() { return "replacement_log.txt"; }
};

/**
 * @brief Immutable, validated configuration with the compiled pattern
 *
 * Only RunConfiguration::create builds one, so holding a RunConfiguration
 * means the pattern and template compiled and exactly one target source
 * was chosen.
 */
class RunConfiguration {
public:
    /**
     * @brief Validate settings and compile the pattern
     * @param settings Merged settings
     * @return Frozen configuration
     * @throws ConfigurationError on any invalid setting
     */
    static RunConfiguration create(const RunSettings& settings);

    const TargetSelection& target() const { return m_target; }
    const SubstitutionEngine& engine() const { return m_engine; }
    const FileFilter& filter() const { return m_filter; }
    bool dryRun() const { return m_dry_run; }
    const std::string& logPath() const { return m_log_path; }
    bool summaryOnly() const { return m_summary_only; }
    bool color() const { return m_color; }
    bool showDiff() const { return m_show_diff; }

private:
    RunConfiguration(TargetSelection target, SubstitutionEngine engine, FileFilter filter,
                     const RunSettings& settings);

    TargetSelection m_target;
    SubstitutionEngine m_engine;
    FileFilter m_filter;
    bool m_dry_run;
    std::string m_log_path;
    bool m_summary_only;
    bool m_color;
    bool m_show_diff;
};

} // namespace Resub
