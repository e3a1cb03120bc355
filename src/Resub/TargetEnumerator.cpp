// =================================================================
// src/Resub/TargetEnumerator.cpp
// =================================================================
// Implementation for discovering the files a run should process.

#include "Resub/TargetEnumerator.hpp"
#include "Resub/Errors.hpp"
#include "Resub/Logger.hpp"
#include <type_traits>
#include <utility>

namespace Resub {

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(first, last - first + 1);
}

} // namespace

std::string describeTarget(const TargetSelection& selection) {
    return std::visit([](const auto& source) -> std::string {
        using T = std::decay_t<decltype(source)>;
        if constexpr (std::is_same_v<T, RootDirectory>) {
            return "root directory '" + source.path + "'";
        } else if constexpr (std::is_same_v<T, ExplicitPaths>) {
            return std::to_string(source.paths.size()) + " explicit path(s)";
        } else {
            return "paths file '" + source.path + "'";
        }
    }, selection);
}

TargetEnumerator::TargetEnumerator(TargetSelection selection, FileFilter filter)
    : m_selection(std::move(selection)),
      m_filter(std::move(filter)),
      m_started(false),
      m_exhausted(false),
      m_explicit_index(0)
{
}

bool TargetEnumerator::next(std::string& path) {
    if (!m_started) {
        start();
    }
    if (m_exhausted) {
        return false;
    }

    bool produced = false;
    if (auto* source = std::get_if<ExplicitPaths>(&m_selection)) {
        produced = nextExplicit(*source, path);
    } else if (std::holds_alternative<PathsFile>(m_selection)) {
        produced = nextFromPathsFile(path);
    } else {
        produced = nextFromWalk(path);
    }

    if (!produced) {
        m_exhausted = true;
    }
    return produced;
}

void TargetEnumerator::reset() {
    m_started = false;
    m_exhausted = false;
    m_explicit_index = 0;
    m_paths_stream.reset();
    m_walk = std::filesystem::recursive_directory_iterator();
}

std::vector<std::string> TargetEnumerator::collect() {
    reset();
    std::vector<std::string> paths;
    std::string path;
    while (next(path)) {
        paths.push_back(path);
    }
    return paths;
}

void TargetEnumerator::start() {
    m_started = true;

    if (auto* source = std::get_if<PathsFile>(&m_selection)) {
        m_paths_stream = std::make_unique<std::ifstream>(source->path, std::ios::binary);
        if (!m_paths_stream->is_open()) {
            m_exhausted = true;
            throw FileError(source->path, "Failed to open paths file");
        }
        RESUB_LOG_DEBUG("TargetEnumerator", "Reading paths from " + source->path);
    } else if (auto* root = std::get_if<RootDirectory>(&m_selection)) {
        std::error_code ec;
        m_walk = std::filesystem::recursive_directory_iterator(
            root->path, std::filesystem::directory_options::skip_permission_denied, ec);
        if (ec) {
            // A missing or unreadable root simply yields nothing
            Logger::getInstance().warning("TargetEnumerator",
                "Cannot walk root directory: " + root->path, ec.message());
            m_exhausted = true;
            return;
        }
        RESUB_LOG_DEBUG("TargetEnumerator", "Walking " + root->path);
    }
}

bool TargetEnumerator::nextExplicit(const ExplicitPaths& source, std::string& path) {
    if (m_explicit_index >= source.paths.size()) {
        return false;
    }
    path = source.paths[m_explicit_index++];
    return true;
}

bool TargetEnumerator::nextFromPathsFile(std::string& path) {
    std::string line;
    while (std::getline(*m_paths_stream, line)) {
        std::string candidate = trim(line);
        if (!candidate.empty()) {
            path = candidate;
            return true;
        }
    }
    m_paths_stream.reset();
    return false;
}

bool TargetEnumerator::nextFromWalk(std::string& path) {
    const std::filesystem::recursive_directory_iterator end;

    while (m_walk != end) {
        const std::filesystem::directory_entry entry = *m_walk;

        std::error_code ec;
        m_walk.increment(ec);
        if (ec) {
            Logger::getInstance().warning("TargetEnumerator",
                "Directory walk stopped early", ec.message());
            m_walk = end;
        }

        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) {
            continue;
        }

        if (m_filter.isIncluded(entry.path().filename().string())) {
            path = entry.path().string();
            return true;
        }
    }
    return false;
}

} // namespace Resub
