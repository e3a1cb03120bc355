// =================================================================
// tests/TargetEnumeratorTest.cpp
// =================================================================
// Unit tests for TargetEnumerator component.

#include "Resub/TargetEnumerator.hpp"
#include "Resub/Errors.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <vector>
#include <algorithm>

namespace fs = std::filesystem;

class TargetEnumeratorTest {
private:
    std::string test_dir;

    void setupTestFiles() {
        fs::create_directories(test_dir + "/dir/sub");
        fs::create_directories(test_dir + "/empty");

        std::ofstream(test_dir + "/top.txt") << "top";
        std::ofstream(test_dir + "/dir/notes.md") << "# notes";
        std::ofstream(test_dir + "/dir/sub/a.txt") << "alpha";
        std::ofstream(test_dir + "/dir/sub/a.txt.bak") << "backup";
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    static bool contains(const std::vector<std::string>& paths, const std::string& wanted) {
        return std::find(paths.begin(), paths.end(), wanted) != paths.end();
    }

public:
    TargetEnumeratorTest() : test_dir("test_target_enumerator") {}

    void testDirectoryWalk() {
        std::cout << "Testing recursive directory walk..." << std::endl;

        setupTestFiles();

        Resub::TargetEnumerator enumerator(Resub::RootDirectory{test_dir}, Resub::FileFilter());
        auto files = enumerator.collect();

        assert(files.size() == 4 && "Walk should yield every regular file and no directories");

        std::string nested = (fs::path(test_dir) / "dir" / "sub" / "a.txt").string();
        assert(contains(files, nested) && "Nested paths are joined to the root");

        cleanupTestFiles();
        std::cout << "✓ Directory walk test passed" << std::endl;
    }

    void testFilteredWalk() {
        std::cout << "Testing include/exclude filtering during walk..." << std::endl;

        setupTestFiles();

        Resub::FileFilter filter({"*.txt", "*.bak"}, {"*.bak"});
        Resub::TargetEnumerator enumerator(Resub::RootDirectory{test_dir}, filter);
        auto files = enumerator.collect();

        assert(files.size() == 2);
        assert(contains(files, (fs::path(test_dir) / "top.txt").string()));
        assert(contains(files, (fs::path(test_dir) / "dir" / "sub" / "a.txt").string()));

        cleanupTestFiles();
        std::cout << "✓ Filtered walk test passed" << std::endl;
    }

    void testFilterUsesFilenameOnly() {
        std::cout << "Testing that globs see only the filename..." << std::endl;

        setupTestFiles();

        Resub::FileFilter filter({"sub*"}, {});
        Resub::TargetEnumerator enumerator(Resub::RootDirectory{test_dir}, filter);
        auto files = enumerator.collect();

        assert(files.empty() && "Directory names must not take part in matching");

        cleanupTestFiles();
        std::cout << "✓ Filename-only filter test passed" << std::endl;
    }

    void testExplicitPathsUnfiltered() {
        std::cout << "Testing explicit paths bypass filters..." << std::endl;

        Resub::FileFilter filter({"*.txt"}, {"*.log"});
        Resub::ExplicitPaths explicit_paths{{"one.log", "missing/two.cfg", "one.log"}};
        Resub::TargetEnumerator enumerator(explicit_paths, filter);

        std::string path;
        assert(enumerator.next(path) && path == "one.log");
        assert(enumerator.next(path) && path == "missing/two.cfg");
        assert(enumerator.next(path) && path == "one.log" && "Duplicates are kept in order");
        assert(!enumerator.next(path));
        assert(!enumerator.next(path) && "Exhausted enumerator stays exhausted");

        std::cout << "✓ Explicit paths test passed" << std::endl;
    }

    void testPathsFile() {
        std::cout << "Testing paths file with blank and padded lines..." << std::endl;

        fs::create_directories(test_dir);
        std::string list_path = test_dir + "/targets.txt";
        std::ofstream(list_path, std::ios::binary) << "  first.txt  \n\n   \r\nsecond.cfg\r\n";

        Resub::FileFilter filter({"*.md"}, {});
        Resub::TargetEnumerator enumerator(Resub::PathsFile{list_path}, filter);
        auto files = enumerator.collect();

        assert(files.size() == 2 && "Blank lines are skipped and no filter applies");
        assert(files[0] == "first.txt" && "Lines are trimmed");
        assert(files[1] == "second.cfg" && "CRLF endings are trimmed");

        cleanupTestFiles();
        std::cout << "✓ Paths file test passed" << std::endl;
    }

    void testSingleLinePathsFile() {
        std::cout << "Testing paths file with one path and a blank line..." << std::endl;

        fs::create_directories(test_dir);
        std::string list_path = test_dir + "/one.txt";
        std::ofstream(list_path) << "only.txt\n\n";

        Resub::TargetEnumerator enumerator(Resub::PathsFile{list_path}, Resub::FileFilter());
        auto files = enumerator.collect();
        assert(files.size() == 1 && files[0] == "only.txt");

        cleanupTestFiles();
        std::cout << "✓ Single line paths file test passed" << std::endl;
    }

    void testMissingPathsFile() {
        std::cout << "Testing unreadable paths file..." << std::endl;

        Resub::TargetEnumerator enumerator(Resub::PathsFile{"no_such_paths_file.txt"}, Resub::FileFilter());

        bool threw = false;
        try {
            std::string path;
            enumerator.next(path);
        } catch (const Resub::FileError& e) {
            threw = true;
            assert(e.path() == "no_such_paths_file.txt");
        }
        assert(threw && "Missing paths file should raise FileError");

        std::cout << "✓ Missing paths file test passed" << std::endl;
    }

    void testMissingRoot() {
        std::cout << "Testing missing root directory..." << std::endl;

        Resub::TargetEnumerator enumerator(Resub::RootDirectory{"no_such_root_dir"}, Resub::FileFilter());
        auto files = enumerator.collect();
        assert(files.empty() && "Missing root yields nothing");

        std::cout << "✓ Missing root test passed" << std::endl;
    }

    void testResetRestarts() {
        std::cout << "Testing reset and repeated collection..." << std::endl;

        setupTestFiles();

        Resub::TargetEnumerator enumerator(Resub::RootDirectory{test_dir}, Resub::FileFilter());
        std::string path;
        assert(enumerator.next(path));

        auto first = enumerator.collect();
        auto second = enumerator.collect();
        std::sort(first.begin(), first.end());
        std::sort(second.begin(), second.end());
        assert(first.size() == 4);
        assert(first == second && "Each collect() restarts from the beginning");

        cleanupTestFiles();
        std::cout << "✓ Reset test passed" << std::endl;
    }

    void testDescribeTarget() {
        std::cout << "Testing target descriptions..." << std::endl;

        assert(Resub::describeTarget(Resub::RootDirectory{"src"}) == "root directory 'src'");
        assert(Resub::describeTarget(Resub::ExplicitPaths{{"a", "b"}}) == "2 explicit path(s)");
        assert(Resub::describeTarget(Resub::PathsFile{"list.txt"}) == "paths file 'list.txt'");

        std::cout << "✓ Describe target test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running TargetEnumerator unit tests..." << std::endl;

        cleanupTestFiles();

        testDirectoryWalk();
        testFilteredWalk();
        testFilterUsesFilenameOnly();
        testExplicitPathsUnfiltered();
        testPathsFile();
        testSingleLinePathsFile();
        testMissingPathsFile();
        testMissingRoot();
        testResetRestarts();
        testDescribeTarget();

        std::cout << "All TargetEnumerator tests passed!" << std::endl;
    }
};

int main() {
    try {
        TargetEnumeratorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All TargetEnumerator component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
