// =================================================================
// include/Resub/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include "Resub/TargetEnumerator.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Resub {

// Everything the user asked for on the command line.
struct Commands {
    // Exactly one source; unset only if parsing was bypassed
    std::optional<TargetSelection> target;

    std::string pattern;
    std::string replacement;

    // Behavior. Empty strings and lists mean "not given on the command line".
    bool dry_run = false;
    std::string log_path;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
    bool summary_only = false;
    bool show_diff = false;
    bool no_color = false;

    // Diagnostics and defaults file
    std::string config_path;
    int verbosity = 0;
    std::string debug_log;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupTargetOptions(CLI::App& app);
    void setupReplacementOptions(CLI::App& app);
    void setupBehaviorOptions(CLI::App& app);
    void setupDiagnosticOptions(CLI::App& app);
    void resolveTarget();

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;

    // Raw target option values, folded into m_commands.target after parsing
    std::string m_root;
    std::vector<std::string> m_paths;
    std::string m_paths_file;
    CLI::Option* m_root_option = nullptr;
    CLI::Option* m_paths_option = nullptr;
    CLI::Option* m_paths_file_option = nullptr;
};

} // namespace Resub
