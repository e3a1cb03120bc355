// =================================================================
// include/Resub/Errors.hpp
// =================================================================
// Exception types shared by the replacement pipeline.

#pragma once

#include <stdexcept>
#include <string>

namespace Resub {

/**
 * @brief Invalid user input detected before any file is touched
 *
 * Raised for bad patterns, bad replacement templates, conflicting or
 * missing target selection and unreadable configuration files.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A file could not be opened, read or written
 */
class FileError : public std::runtime_error {
public:
    FileError(const std::string& path, const std::string& message)
        : std::runtime_error(message + ": " + path), m_path(path) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

/**
 * @brief No decoder in the chain accepted a file's bytes
 */
class DecodeError : public FileError {
public:
    explicit DecodeError(const std::string& path)
        : FileError(path, "No decoder could read file") {}
};

/**
 * @brief Text cannot be represented in the output encoding
 */
class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace Resub
