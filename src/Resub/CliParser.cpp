// =================================================================
// src/Resub/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Resub/CliParser.hpp"
#include <algorithm>

namespace Resub {

namespace {

// Zero-argument list options may leave empty strings behind
void dropEmpty(std::vector<std::string>& values) {
    values.erase(std::remove(values.begin(), values.end(), std::string()), values.end());
}

} // namespace

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("resub: recursive regex search and replace for text files.");

    setupTargetOptions(*m_app);
    setupReplacementOptions(*m_app);
    setupBehaviorOptions(*m_app);
    setupDiagnosticOptions(*m_app);

    m_app->callback([this]() {
        resolveTarget();
        dropEmpty(m_commands.include_patterns);
        dropEmpty(m_commands.exclude_patterns);
    });

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupTargetOptions(CLI::App& app) {
    auto* group = app.add_option_group("Target selection", "Exactly one of --root, --paths, --paths-file");
    m_root_option = group->add_option("--root", m_root, "Root directory to recursively scan");
    m_paths_option = group->add_option("--paths", m_paths, "Explicit list of files to process");
    m_paths_file_option = group->add_option("--paths-file", m_paths_file, "Text file containing one file path per line");
    group->require_option(1);
}

void CliParser::setupReplacementOptions(CLI::App& app) {
    app.add_option("--pattern", m_commands.pattern, "Regex pattern to search (with optional capture groups)")->required();
    app.add_option("--replace", m_commands.replacement, "Replacement string (supports \\1, \\2, \\g<name>, etc.)")->required();
}

void CliParser::setupBehaviorOptions(CLI::App& app) {
    app.add_flag("--dry-run", m_commands.dry_run, "Simulate only, do not modify files");
    app.add_option("--log", m_commands.log_path, "Log file path (default: replacement_log.txt)");
    app.add_option("--files", m_commands.include_patterns, "Include only files matching these patterns (e.g. *.xml)")
        ->expected(0, CLI::detail::expected_max_vector_size);
    app.add_option("--files-exclude", m_commands.exclude_patterns, "Exclude files matching these patterns (e.g. *.bak)")
        ->expected(0, CLI::detail::expected_max_vector_size);
    app.add_flag("--summary-only", m_commands.summary_only, "Suppress file-level replacement output");
    app.add_flag("--diff", m_commands.show_diff, "Show a line diff for every file that changes");
    app.add_flag("--no-color", m_commands.no_color, "Disable colored output");
}

void CliParser::setupDiagnosticOptions(CLI::App& app) {
    app.add_option("--config", m_commands.config_path, "YAML file with default options (default: .resub/config.yml)");
    app.add_flag("-v,--verbose", m_commands.verbosity, "Increase diagnostic output (repeat for debug)");
    app.add_option("--debug-log", m_commands.debug_log, "Also write diagnostics to this file");
}

void CliParser::resolveTarget() {
    if (m_root_option && m_root_option->count() > 0) {
        m_commands.target = RootDirectory{m_root};
    } else if (m_paths_option && m_paths_option->count() > 0) {
        m_commands.target = ExplicitPaths{m_paths};
    } else if (m_paths_file_option && m_paths_file_option->count() > 0) {
        m_commands.target = PathsFile{m_paths_file};
    }
}

} // namespace Resub
