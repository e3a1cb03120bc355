#include "Resub/CliParser.hpp"
#include "Resub/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    Resub::CliParser parser;
    auto app = parser.setupCli();

    // Usage errors (missing --pattern, two target options, ...) end here
    // with a non-zero exit code before anything is read or written.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    Resub::Core core(parser.getCommands());

    // File errors abort the remaining files; changes already written stay.
    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
