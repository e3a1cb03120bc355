// =================================================================
// include/Resub/Core.hpp
// =================================================================
// Defines the run orchestrator.

#pragma once

#include "Resub/CliParser.hpp"
#include "Resub/RunStatistics.hpp"
#include <iostream>
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Resub {
    class ConsoleReporter;
    class FileAdapter;
    class RunConfiguration;
    class RunLog;
}

namespace Resub {

/**
 * @brief Phases of a run, in order
 */
enum class RunState {
    Initializing,   ///< Validate configuration, compile pattern
    Enumerating,    ///< Pull the next candidate path
    Processing,     ///< Read, substitute, write, log one file
    Summarizing,    ///< Print summary, persist the log
    Done
};

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     * @param out Stream for the run narration and summary.
     */
    explicit Core(const Commands& commands, std::ostream& out = std::cout);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the whole pipeline.
     * @return 0 on completion, 1 on a configuration error (nothing touched,
     *         no log written). File errors propagate as exceptions and
     *         abort the remaining files.
     */
    int run();

    const RunStatistics& statistics() const { return m_stats; }
    RunState state() const { return m_state; }

    static std::string getStateName(RunState state);

private:
    void configureLogging();
    RunConfiguration loadConfiguration() const;
    FileOutcome processFile(const std::string& file_path, const RunConfiguration& config,
                            ConsoleReporter& reporter, RunLog& log);
    void transition(RunState next);

    const Commands& m_commands;
    std::ostream& m_out;
    std::unique_ptr<FileAdapter> m_files;
    RunState m_state;
    RunStatistics m_stats;
};

} // namespace Resub
