// =================================================================
// include/Resub/TextCodec.hpp
// =================================================================
// Decoders and encoder used to move between file bytes and the
// UTF-8 text the substitution engine works on.

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Resub {

/**
 * @brief Turns raw file bytes into UTF-8 text
 *
 * A decoder either accepts the whole byte sequence or rejects it; it never
 * decodes partially.
 */
class TextDecoder {
public:
    virtual ~TextDecoder() = default;

    /**
     * @brief Encoding name used in diagnostics
     */
    virtual std::string name() const = 0;

    /**
     * @brief Decode a byte sequence
     * @param bytes Raw file content
     * @return UTF-8 text, or std::nullopt if the bytes are not valid
     *         in this encoding
     */
    virtual std::optional<std::string> decode(const std::string& bytes) const = 0;
};

/**
 * @brief Strict UTF-8 validation; valid input is returned as-is
 *
 * Rejects overlong forms, surrogates and code points above U+10FFFF.
 */
class Utf8Decoder : public TextDecoder {
public:
    std::string name() const override { return "utf-8"; }
    std::optional<std::string> decode(const std::string& bytes) const override;
};

/**
 * @brief ISO-8859-1: every byte is the code point of the same value
 *
 * Accepts any byte sequence.
 */
class Latin1Decoder : public TextDecoder {
public:
    std::string name() const override { return "latin-1"; }
    std::optional<std::string> decode(const std::string& bytes) const override;
};

/**
 * @brief Encodes UTF-8 text back to ISO-8859-1 bytes
 */
class Latin1Encoder {
public:
    /**
     * @brief Encode text
     * @param text UTF-8 text
     * @return One byte per code point
     * @throws EncodingError for code points above U+00FF or malformed UTF-8
     */
    std::string encode(const std::string& text) const;
};

/**
 * @brief The default decoder chain: UTF-8 first, then Latin-1
 */
std::vector<std::unique_ptr<TextDecoder>> defaultDecoders();

/**
 * @brief Append the UTF-8 form of a code point
 * @param out Destination string
 * @param code_point Unicode scalar value
 */
void appendUtf8(std::string& out, uint32_t code_point);

} // namespace Resub
