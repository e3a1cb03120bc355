// =================================================================
// tests/FileFilterTest.cpp
// =================================================================
// Unit tests for GlobPattern and FileFilter.

#include "Resub/FileFilter.hpp"
#include "Resub/Errors.hpp"
#include <iostream>
#include <cassert>

class GlobPatternTest {
public:
    void testWildcards() {
        std::cout << "Testing * and ? wildcards..." << std::endl;

        Resub::GlobPattern star("*.txt");
        assert(star.matches("a.txt") && "Should match simple txt file");
        assert(star.matches(".txt") && "* should match an empty prefix");
        assert(!star.matches("a.txt.bak") && "Should anchor at the end");
        assert(!star.matches("atxt") && "Dot must be literal");

        Resub::GlobPattern question("file?.log");
        assert(question.matches("file1.log"));
        assert(!question.matches("file.log") && "? needs exactly one character");
        assert(!question.matches("file12.log"));

        Resub::GlobPattern everything("*");
        assert(everything.matches("anything.at.all"));
        assert(everything.matches(""));

        std::cout << "✓ Wildcard test passed" << std::endl;
    }

    void testCharacterSets() {
        std::cout << "Testing [seq] and [!seq] sets..." << std::endl;

        Resub::GlobPattern set("data[0-9].csv");
        assert(set.matches("data7.csv"));
        assert(!set.matches("dataX.csv"));

        Resub::GlobPattern negated("[!_]*.py");
        assert(negated.matches("main.py"));
        assert(!negated.matches("_private.py") && "Negated set should reject leading underscore");

        Resub::GlobPattern bracket("[]]x");
        assert(bracket.matches("]x") && "Leading ] is a set member");

        Resub::GlobPattern unterminated("a[b");
        assert(unterminated.matches("a[b") && "Unterminated [ is literal");
        assert(!unterminated.matches("ab"));

        std::cout << "✓ Character set test passed" << std::endl;
    }

    void testCaseSensitivityAndSpecials() {
        std::cout << "Testing case sensitivity and regex specials..." << std::endl;

        Resub::GlobPattern upper("*.TXT");
        assert(!upper.matches("notes.txt") && "Matching is case-sensitive");
        assert(upper.matches("NOTES.TXT"));

        Resub::GlobPattern specials("a+(b)|c^$.{1}");
        assert(specials.matches("a+(b)|c^$.{1}") && "Regex metacharacters must be literal");
        assert(!specials.matches("aa(b)|c^$.{1}"));

        std::cout << "✓ Case sensitivity test passed" << std::endl;
    }

    void testNonAsciiNames() {
        std::cout << "Testing wildcards against non-ASCII names..." << std::endl;

        Resub::GlobPattern question("?.txt");
        assert(question.matches("\xC3\xA9.txt") && "? matches a whole UTF-8 character");
        assert(question.matches("\xE9.txt") && "Names that are not UTF-8 are read as Latin-1");
        assert(!question.matches("\xC3\xA9\xC3\xA9.txt"));

        Resub::GlobPattern set("[\xC3\xA9]x");
        assert(set.matches("\xC3\xA9x"));
        assert(!set.matches("ex"));

        Resub::GlobPattern negated("[!\xC3\xA9]x");
        assert(!negated.matches("\xC3\xA9x"));
        assert(negated.matches("\xC3\xA8x"));

        std::cout << "✓ Non-ASCII name test passed" << std::endl;
    }

    void testInvalidSet() {
        std::cout << "Testing reversed range..." << std::endl;

        bool threw = false;
        try {
            Resub::GlobPattern reversed("[z-a]");
        } catch (const Resub::ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Reversed range should be a configuration error");

        std::cout << "✓ Reversed range test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running GlobPattern unit tests..." << std::endl;

        testWildcards();
        testCharacterSets();
        testCaseSensitivityAndSpecials();
        testNonAsciiNames();
        testInvalidSet();

        std::cout << "All GlobPattern tests passed!" << std::endl;
    }
};

class FileFilterTest {
public:
    void testDefaults() {
        std::cout << "Testing default include/exclude sets..." << std::endl;

        Resub::FileFilter filter;
        assert(filter.includeCount() == 1 && "Default include set is a single *");
        assert(filter.excludeCount() == 0);
        assert(filter.isIncluded("main.cpp"));
        assert(filter.isIncluded("Makefile"));

        std::cout << "✓ Defaults test passed" << std::endl;
    }

    void testIncludeOnly() {
        std::cout << "Testing include patterns..." << std::endl;

        Resub::FileFilter filter({"*.xml", "*.html"}, {});
        assert(filter.isIncluded("layout.xml"));
        assert(filter.isIncluded("index.html"));
        assert(!filter.isIncluded("style.css") && "Files matching no include glob are dropped");

        std::cout << "✓ Include test passed" << std::endl;
    }

    void testExcludeWins() {
        std::cout << "Testing include/exclude interaction..." << std::endl;

        Resub::FileFilter filter({"*.txt"}, {"*.txt"});
        assert(!filter.isIncluded("a.txt") && "Matching both include and exclude means excluded");

        Resub::FileFilter backups({}, {"*.bak", "*~"});
        assert(backups.isIncluded("a.txt"));
        assert(!backups.isIncluded("a.txt.bak"));
        assert(!backups.isIncluded("a.txt~"));

        std::cout << "✓ Exclude test passed" << std::endl;
    }

    void testNonAsciiInclude() {
        std::cout << "Testing include patterns on non-ASCII names..." << std::endl;

        Resub::FileFilter filter({"?.txt"}, {});
        assert(filter.isIncluded("\xC3\xA9.txt"));
        assert(!filter.isIncluded("ab.txt"));

        std::cout << "✓ Non-ASCII include test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running FileFilter unit tests..." << std::endl;

        testDefaults();
        testIncludeOnly();
        testExcludeWins();
        testNonAsciiInclude();

        std::cout << "All FileFilter tests passed!" << std::endl;
    }
};

int main() {
    try {
        GlobPatternTest glob_tests;
        glob_tests.runAllTests();

        std::cout << std::endl;

        FileFilterTest filter_tests;
        filter_tests.runAllTests();

        std::cout << "\n🎉 All FileFilter component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
