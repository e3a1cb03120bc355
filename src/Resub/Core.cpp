// =================================================================
// src/Resub/Core.cpp
// =================================================================
// Implementation for the run orchestrator.

#include "Resub/Core.hpp"
#include "Resub/ConfigParser.hpp"
#include "Resub/ConsoleReporter.hpp"
#include "Resub/Errors.hpp"
#include "Resub/FileAdapter.hpp"
#include "Resub/Logger.hpp"
#include "Resub/RunConfig.hpp"
#include "Resub/RunLog.hpp"
#include "Resub/TargetEnumerator.hpp"
#include <chrono>
#include <optional>

namespace Resub {

namespace {

const char* const DEFAULT_CONFIG_PATH = ".resub/config.yml";

} // namespace

Core::Core(const Commands& commands, std::ostream& out)
    : m_commands(commands),
      m_out(out),
      m_files(std::make_unique<FileAdapter>()),
      m_state(RunState::Initializing)
{
}

// Destructor must be defined here where FileAdapter is a complete type
Core::~Core() = default;

int Core::run() {
    auto start_time = std::chrono::steady_clock::now();
    m_state = RunState::Initializing;
    m_stats = RunStatistics();

    configureLogging();

    std::optional<RunConfiguration> config;
    try {
        config.emplace(loadConfiguration());
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << std::endl;
        RESUB_LOG_DEBUG("Core", "Run aborted during initialization");
        return 1;
    }

    Logger& logger = Logger::getInstance();
    logger.logRunStart(describeTarget(config->target()), config->engine().pattern(), config->dryRun());

    ConsoleReporter reporter(m_out, config->color(), config->summaryOnly(), config->showDiff());
    RunLog log(config->logPath());
    TargetEnumerator targets(config->target(), config->filter());

    transition(RunState::Enumerating);
    std::string file_path;
    while (targets.next(file_path)) {
        transition(RunState::Processing);
        m_stats.add(processFile(file_path, *config, reporter, log));
        transition(RunState::Enumerating);
    }

    transition(RunState::Summarizing);
    reporter.summary(log.finalize(m_stats));

    if (!log.flush()) {
        // The run itself completed; only the log is missing
        std::cerr << "[ERROR] Failed to save log to " << log.destination() << std::endl;
    }

    transition(RunState::Done);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    logger.logRunEnd(m_stats.files_modified, m_stats.total_replacements, duration.count());
    logger.flush();
    return 0;
}

std::string Core::getStateName(RunState state) {
    switch (state) {
        case RunState::Initializing: return "Initializing";
        case RunState::Enumerating: return "Enumerating";
        case RunState::Processing: return "Processing";
        case RunState::Summarizing: return "Summarizing";
        case RunState::Done: return "Done";
        default: return "Unknown";
    }
}

void Core::configureLogging() {
    Logger& logger = Logger::getInstance();
    logger.initialize(m_commands.debug_log);

    if (m_commands.verbosity >= 2) {
        logger.setConsoleLogLevel(LogLevel::DEBUG);
    } else if (m_commands.verbosity == 1) {
        logger.setConsoleLogLevel(LogLevel::INFO);
    } else {
        logger.setConsoleLogLevel(LogLevel::WARNING);
    }
    logger.setConsoleColor(!m_commands.no_color);
}

RunConfiguration Core::loadConfiguration() const {
    const bool explicit_config = !m_commands.config_path.empty();
    ConfigParser file_config(explicit_config ? m_commands.config_path : DEFAULT_CONFIG_PATH, explicit_config);

    RunSettings settings;
    settings.loadFromConfig(file_config);
    settings.applyCommandOverrides(m_commands);
    if (settings.color && !ConsoleReporter::supportsColor()) {
        settings.color = false;
    }

    return RunConfiguration::create(settings);
}

FileOutcome Core::processFile(const std::string& file_path, const RunConfiguration& config,
                              ConsoleReporter& reporter, RunLog& log) {
    FileOutcome outcome;
    outcome.path = file_path;

    DecodedText decoded = m_files->readText(file_path);
    SubstitutionResult result = config.engine().process(decoded.text);

    if (!result.hasMatches()) {
        reporter.fileSkipped(file_path);
        return outcome;
    }

    outcome.replacements = result.matches.size();

    if (config.dryRun()) {
        reporter.fileWouldModify(file_path, result.matches);
    } else {
        m_files->writeText(file_path, result.new_content);
        outcome.written = true;
        reporter.fileModified(file_path);
    }
    reporter.fileDiff(decoded.text, result.new_content);

    for (const auto& match : result.matches) {
        log.record(file_path, match.before, match.after);
    }

    RESUB_LOG_DEBUG("Core", file_path + ": " + std::to_string(outcome.replacements) + " replacement(s)");
    return outcome;
}

void Core::transition(RunState next) {
    RESUB_LOG_DEBUG("Core", "State " + getStateName(m_state) + " -> " + getStateName(next));
    m_state = next;
}

} // namespace Resub
