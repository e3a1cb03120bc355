// =================================================================
// src/Resub/RunConfig.cpp
// =================================================================
// Implementation for run configuration management.

#include "Resub/RunConfig.hpp"
#include "Resub/CliParser.hpp"
#include "Resub/ConfigParser.hpp"
#include "Resub/Errors.hpp"
#include "Resub/Logger.hpp"

namespace Resub {

void RunSettings::loadFromConfig(const ConfigParser& config) {
    std::string log_str = config.getStringValue("log");
    if (!log_str.empty()) {
        log_path = log_str;
    }

    if (auto value = config.getBoolValue("dry_run")) {
        dry_run = *value;
    }
    if (auto value = config.getBoolValue("summary_only")) {
        summary_only = *value;
    }
    if (auto value = config.getBoolValue("color")) {
        color = *value;
    }
    if (auto value = config.getBoolValue("diff")) {
        show_diff = *value;
    }

    if (config.hasKey("include")) {
        include_patterns = config.getListValue("include");
    }
    if (config.hasKey("exclude")) {
        exclude_patterns = config.getListValue("exclude");
    }

    for (const char* key : {"root", "paths", "paths_file", "pattern", "replace"}) {
        if (config.hasKey(key)) {
            Logger::getInstance().warning("RunSettings",
                std::string("Ignoring '") + key + "' in configuration file; pass it on the command line",
                config.path());
        }
    }
}

void RunSettings::applyCommandOverrides(const Commands& commands) {
    if (commands.target) {
        target = commands.target;
    }
    pattern = commands.pattern;
    replacement = commands.replacement;

    // Flags can only switch behavior on
    if (commands.dry_run) {
        dry_run = true;
    }
    if (commands.summary_only) {
        summary_only = true;
    }
    if (commands.show_diff) {
        show_diff = true;
    }
    if (commands.no_color) {
        color = false;
    }

    if (!commands.log_path.empty()) {
        log_path = commands.log_path;
    }
    if (!commands.include_patterns.empty()) {
        include_patterns = commands.include_patterns;
    }
    if (!commands.exclude_patterns.empty()) {
        exclude_patterns = commands.exclude_patterns;
    }
}

void RunSettings::validate() const {
    if (!target) {
        throw ConfigurationError("Exactly one of --root, --paths or --paths-file is required");
    }
    if (const auto* explicit_paths = std::get_if<ExplicitPaths>(&*target)) {
        if (explicit_paths->paths.empty()) {
            throw ConfigurationError("--paths needs at least one file");
        }
    }
    if (log_path.empty()) {
        throw ConfigurationError("Log path cannot be empty");
    }
}

// RunConfiguration implementation

RunConfiguration RunConfiguration::create(const RunSettings& settings) {
    settings.validate();

    SubstitutionEngine engine(settings.pattern, settings.replacement);
    FileFilter filter(settings.include_patterns, settings.exclude_patterns);

    return RunConfiguration(*settings.target, std::move(engine), std::move(filter), settings);
}

RunConfiguration::RunConfiguration(TargetSelection target, SubstitutionEngine engine, FileFilter filter,
                                   const RunSettings& settings)
    : m_target(std::move(target)),
      m_engine(std::move(engine)),
      m_filter(std::move(filter)),
      m_dry_run(settings.dry_run),
      m_log_path(settings.log_path),
      m_summary_only(settings.summary_only),
      m_color(settings.color),
      m_show_diff(settings.show_diff)
{
}

} // namespace Resub
