// =================================================================
// tests/ConfigTest.cpp
// =================================================================
// Unit tests for ConfigParser, RunSettings and RunConfiguration.

#include "Resub/ConfigParser.hpp"
#include "Resub/RunConfig.hpp"
#include "Resub/CliParser.hpp"
#include "Resub/Errors.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>

namespace fs = std::filesystem;

class ConfigParserTest {
private:
    std::string test_dir;

    void setupTestDir() {
        cleanupTestDir();
        fs::create_directories(test_dir);
    }

    void cleanupTestDir() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

public:
    ConfigParserTest() : test_dir("test_config_parser") {}

    void testLoadValues() {
        std::cout << "Testing YAML value loading..." << std::endl;

        setupTestDir();
        std::ofstream(test_dir + "/config.yml") << R"(
log: logs/replacements.txt
dry_run: yes
summary_only: false
include:
  - "*.xml"
  - "*.html"
exclude: "*.bak"
)";

        Resub::ConfigParser config(test_dir + "/config.yml");
        assert(config.isLoaded());
        assert(config.path() == test_dir + "/config.yml");
        assert(config.getStringValue("log") == "logs/replacements.txt");
        assert(config.getStringValue("absent").empty());

        assert(config.getBoolValue("dry_run") == std::optional<bool>(true));
        assert(config.getBoolValue("summary_only") == std::optional<bool>(false));
        assert(!config.getBoolValue("diff").has_value());

        auto include = config.getListValue("include");
        assert(include.size() == 2 && include[0] == "*.xml" && include[1] == "*.html");

        auto exclude = config.getListValue("exclude");
        assert(exclude.size() == 1 && exclude[0] == "*.bak" && "A scalar becomes a one-element list");

        assert(config.hasKey("include"));
        assert(!config.hasKey("color"));

        cleanupTestDir();
        std::cout << "✓ Value loading test passed" << std::endl;
    }

    void testMissingFile() {
        std::cout << "Testing missing configuration file..." << std::endl;

        Resub::ConfigParser optional("no_such_config.yml");
        assert(!optional.isLoaded() && "Optional missing file yields an empty configuration");
        assert(!optional.hasKey("log"));

        bool threw = false;
        try {
            Resub::ConfigParser required("no_such_config.yml", true);
        } catch (const Resub::ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Required missing file should throw");

        std::cout << "✓ Missing file test passed" << std::endl;
    }

    void testMalformedFile() {
        std::cout << "Testing malformed configuration files..." << std::endl;

        setupTestDir();
        std::ofstream(test_dir + "/broken.yml") << "log: [unterminated\n";
        std::ofstream(test_dir + "/list.yml") << "- just\n- a list\n";
        std::ofstream(test_dir + "/empty.yml") << "";

        bool threw = false;
        try {
            Resub::ConfigParser broken(test_dir + "/broken.yml");
        } catch (const Resub::ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Invalid YAML should throw");

        threw = false;
        try {
            Resub::ConfigParser list(test_dir + "/list.yml");
        } catch (const Resub::ConfigurationError&) {
            threw = true;
        }
        assert(threw && "A non-mapping root should throw");

        Resub::ConfigParser empty(test_dir + "/empty.yml");
        assert(empty.isLoaded() && "An empty file is a valid empty configuration");

        cleanupTestDir();
        std::cout << "✓ Malformed file test passed" << std::endl;
    }

    void testBadBoolean() {
        std::cout << "Testing non-boolean flag values..." << std::endl;

        setupTestDir();
        std::ofstream(test_dir + "/config.yml") << "dry_run: sometimes\n";

        Resub::ConfigParser config(test_dir + "/config.yml");
        bool threw = false;
        try {
            config.getBoolValue("dry_run");
        } catch (const Resub::ConfigurationError&) {
            threw = true;
        }
        assert(threw);

        cleanupTestDir();
        std::cout << "✓ Bad boolean test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ConfigParser unit tests..." << std::endl;

        testLoadValues();
        testMissingFile();
        testMalformedFile();
        testBadBoolean();

        std::cout << "All ConfigParser tests passed!" << std::endl;
    }
};

class RunConfigTest {
private:
    std::string test_dir;

    void setupTestDir() {
        cleanupTestDir();
        fs::create_directories(test_dir);
    }

    void cleanupTestDir() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    static Resub::Commands basicCommands() {
        Resub::Commands commands;
        commands.target = Resub::RootDirectory{"src"};
        commands.pattern = "foo(\\d+)";
        commands.replacement = "bar\\1";
        return commands;
    }

public:
    RunConfigTest() : test_dir("test_run_config") {}

    void testDefaults() {
        std::cout << "Testing settings defaults..." << std::endl;

        Resub::RunSettings settings;
        assert(!settings.target.has_value());
        assert(!settings.dry_run);
        assert(settings.log_path == "replacement_log.txt");
        assert(settings.include_patterns.empty());
        assert(settings.exclude_patterns.empty());
        assert(!settings.summary_only);
        assert(settings.color);
        assert(!settings.show_diff);

        std::cout << "✓ Defaults test passed" << std::endl;
    }

    void testFileThenCommandLine() {
        std::cout << "Testing configuration file merged with command line..." << std::endl;

        setupTestDir();
        std::ofstream(test_dir + "/config.yml") << R"(
log: from_file.txt
color: off
diff: true
include: ["*.xml"]
exclude: ["*.bak"]
pattern: ignored
)";

        Resub::ConfigParser config(test_dir + "/config.yml");
        Resub::RunSettings settings;
        settings.loadFromConfig(config);

        assert(settings.log_path == "from_file.txt");
        assert(!settings.color);
        assert(settings.show_diff);
        assert(settings.pattern.empty() && "Pattern is never read from the file");

        Resub::Commands commands = basicCommands();
        commands.include_patterns = {"*.txt", "*.md"};
        commands.dry_run = true;
        settings.applyCommandOverrides(commands);

        assert(settings.log_path == "from_file.txt" && "Unset --log keeps the file value");
        assert(settings.include_patterns.size() == 2 && settings.include_patterns[0] == "*.txt");
        assert(settings.exclude_patterns.size() == 1 && settings.exclude_patterns[0] == "*.bak");
        assert(settings.dry_run);
        assert(settings.pattern == "foo(\\d+)");
        assert(settings.replacement == "bar\\1");
        assert(std::holds_alternative<Resub::RootDirectory>(*settings.target));

        commands.log_path = "cli.txt";
        commands.no_color = true;
        settings.applyCommandOverrides(commands);
        assert(settings.log_path == "cli.txt");
        assert(!settings.color);

        cleanupTestDir();
        std::cout << "✓ Merge test passed" << std::endl;
    }

    void testCreate() {
        std::cout << "Testing RunConfiguration creation..." << std::endl;

        Resub::RunSettings settings;
        settings.applyCommandOverrides(basicCommands());
        settings.include_patterns = {"*.txt"};
        settings.dry_run = true;

        auto config = Resub::RunConfiguration::create(settings);
        assert(config.dryRun());
        assert(config.logPath() == "replacement_log.txt");
        assert(config.engine().pattern() == "foo(\\d+)");
        assert(config.filter().isIncluded("a.txt"));
        assert(!config.filter().isIncluded("a.md"));
        assert(std::get<Resub::RootDirectory>(config.target()).path == "src");

        std::cout << "✓ Creation test passed" << std::endl;
    }

    void testCreateRejectsBadSettings() {
        std::cout << "Testing RunConfiguration validation..." << std::endl;

        auto rejects = [](const Resub::RunSettings& settings) {
            try {
                Resub::RunConfiguration::create(settings);
            } catch (const Resub::ConfigurationError&) {
                return true;
            }
            return false;
        };

        Resub::RunSettings no_target;
        no_target.pattern = "x";
        assert(rejects(no_target) && "A target source is required");

        Resub::RunSettings bad_pattern;
        bad_pattern.applyCommandOverrides(basicCommands());
        bad_pattern.pattern = "foo(";
        assert(rejects(bad_pattern));

        Resub::RunSettings bad_template;
        bad_template.applyCommandOverrides(basicCommands());
        bad_template.replacement = "\\5";
        assert(rejects(bad_template));

        Resub::RunSettings empty_paths;
        empty_paths.applyCommandOverrides(basicCommands());
        empty_paths.target = Resub::ExplicitPaths{};
        assert(rejects(empty_paths));

        Resub::RunSettings empty_log;
        empty_log.applyCommandOverrides(basicCommands());
        empty_log.log_path.clear();
        assert(rejects(empty_log));

        Resub::RunSettings bad_glob;
        bad_glob.applyCommandOverrides(basicCommands());
        bad_glob.exclude_patterns = {"[z-a]"};
        assert(rejects(bad_glob));

        std::cout << "✓ Validation test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running RunConfig unit tests..." << std::endl;

        testDefaults();
        testFileThenCommandLine();
        testCreate();
        testCreateRejectsBadSettings();

        std::cout << "All RunConfig tests passed!" << std::endl;
    }
};

int main() {
    try {
        ConfigParserTest parser_tests;
        parser_tests.runAllTests();

        std::cout << std::endl;

        RunConfigTest config_tests;
        config_tests.runAllTests();

        std::cout << "\n🎉 All configuration tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
