// =================================================================
// include/Resub/FileAdapter.hpp
// =================================================================
// Defines file reading with an encoding fallback chain and
// byte-preserving writes.

#pragma once

#include "Resub/TextCodec.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Resub {

/**
 * @brief File text plus the encoding that decoded it
 */
struct DecodedText {
    std::string text;
    std::string encoding;
};

class FileAdapter {
public:
    /**
     * @brief Uses the default chain: UTF-8, then Latin-1.
     */
    FileAdapter();

    /**
     * @brief Uses a custom decoder chain, tried in order.
     */
    explicit FileAdapter(std::vector<std::unique_ptr<TextDecoder>> decoders);

    /**
     * @brief Reads a file and decodes it with the first decoder that accepts it.
     * @param file_path The path to the file.
     * @return The decoded text. Throws FileError if the file cannot be read,
     *         DecodeError if every decoder rejects it.
     */
    DecodedText readText(const std::string& file_path) const;

    /**
     * @brief Overwrites a file with text encoded as Latin-1.
     *
     * The output encoding does not depend on which decoder read the file.
     * Throws FileError on open/write failure or when the text holds
     * characters Latin-1 cannot represent.
     */
    void writeText(const std::string& file_path, const std::string& text) const;

    /**
     * @brief Reads the raw bytes of a file. Throws FileError on failure.
     */
    static std::string readBytes(const std::string& file_path);

    /**
     * @brief Overwrites a file with raw bytes. Throws FileError on failure.
     */
    static void writeBytes(const std::string& file_path, const std::string& bytes);

private:
    std::vector<std::unique_ptr<TextDecoder>> m_decoders;
    Latin1Encoder m_encoder;
};

} // namespace Resub
