// =================================================================
// include/Resub/TargetEnumerator.hpp
// =================================================================
// Header for discovering the files a run should process.

#pragma once

#include <string>
#include <vector>
#include <variant>
#include <fstream>
#include <memory>
#include <filesystem>
#include "FileFilter.hpp"

namespace Resub {

/// Recursively walk a directory, filtering filenames with the FileFilter.
struct RootDirectory {
    std::string path;
};

/// Process exactly these paths, unfiltered.
struct ExplicitPaths {
    std::vector<std::string> paths;
};

/// Read one path per line from a text file, unfiltered.
struct PathsFile {
    std::string path;
};

/**
 * @brief The single source of target paths for a run
 */
using TargetSelection = std::variant<RootDirectory, ExplicitPaths, PathsFile>;

/**
 * @brief Human readable description of a target selection
 * @param selection Selected source
 * @return e.g. "root directory 'src'"
 */
std::string describeTarget(const TargetSelection& selection);

/**
 * @brief Lazily yields candidate file paths from one TargetSelection
 *
 * Paths are produced one at a time by next(); nothing is read from disk
 * until the first call. reset() restarts the sequence from scratch.
 *
 * The directory walk yields files in the order the filesystem reports
 * them. That order is not sorted and may differ between machines.
 */
class TargetEnumerator {
public:
    /**
     * @brief Construct an enumerator
     * @param selection Where the paths come from
     * @param filter Applied to bare filenames during a directory walk only
     */
    TargetEnumerator(TargetSelection selection, FileFilter filter);

    /**
     * @brief Produce the next candidate path
     * @param path Receives the path when one is available
     * @return false once the sequence is exhausted
     * @throws FileError if the paths file cannot be opened
     */
    bool next(std::string& path);

    /**
     * @brief Restart enumeration from the beginning
     */
    void reset();

    /**
     * @brief Restart and drain the whole sequence into a vector
     * @return All candidate paths in enumeration order
     */
    std::vector<std::string> collect();

    const TargetSelection& selection() const { return m_selection; }

private:
    TargetSelection m_selection;
    FileFilter m_filter;
    bool m_started;
    bool m_exhausted;

    size_t m_explicit_index;
    std::unique_ptr<std::ifstream> m_paths_stream;
    std::filesystem::recursive_directory_iterator m_walk;

    void start();
    bool nextExplicit(const ExplicitPaths& source, std::string& path);
    bool nextFromPathsFile(std::string& path);
    bool nextFromWalk(std::string& path);
};

} // namespace Resub
