// =================================================================
// src/Resub/FileAdapter.cpp
// =================================================================
// Implementation for file reading and writing.

#include "Resub/FileAdapter.hpp"
#include "Resub/Errors.hpp"
#include "Resub/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace Resub {

FileAdapter::FileAdapter()
    : m_decoders(defaultDecoders())
{
}

FileAdapter::FileAdapter(std::vector<std::unique_ptr<TextDecoder>> decoders)
    : m_decoders(std::move(decoders))
{
}

DecodedText FileAdapter::readText(const std::string& file_path) const {
    const std::string bytes = readBytes(file_path);

    for (size_t i = 0; i < m_decoders.size(); ++i) {
        auto text = m_decoders[i]->decode(bytes);
        if (text) {
            if (i > 0) {
                Logger::getInstance().info("FileAdapter",
                    "Decoded with fallback encoding: " + file_path, m_decoders[i]->name());
            }
            return {std::move(*text), m_decoders[i]->name()};
        }
        RESUB_LOG_DEBUG("FileAdapter", m_decoders[i]->name() + " rejected " + file_path);
    }

    throw DecodeError(file_path);
}

void FileAdapter::writeText(const std::string& file_path, const std::string& text) const {
    std::string bytes;
    try {
        bytes = m_encoder.encode(text);
    } catch (const EncodingError& e) {
        throw FileError(file_path, std::string("Cannot encode content (") + e.what() + ")");
    }
    writeBytes(file_path, bytes);
}

std::string FileAdapter::readBytes(const std::string& file_path) {
    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec)) {
        throw FileError(file_path, "Is a directory");
    }

    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw FileError(file_path, "Failed to open file");
    }

    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    if (file_stream.bad()) {
        throw FileError(file_path, "Failed to read file");
    }
    return buffer.str();
}

void FileAdapter::writeBytes(const std::string& file_path, const std::string& bytes) {
    std::ofstream file_stream(file_path, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        throw FileError(file_path, "Failed to open file for writing");
    }
    file_stream.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file_stream.flush();
    if (!file_stream.good()) {
        throw FileError(file_path, "Failed to write file");
    }
}

} // namespace Resub
