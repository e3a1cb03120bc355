// =================================================================
// src/Resub/TextCodec.cpp
// =================================================================
// Implementation for file text decoding and encoding.

#include "Resub/TextCodec.hpp"
#include "Resub/Errors.hpp"
#include <iomanip>
#include <sstream>

namespace Resub {

namespace {

// Decode one UTF-8 sequence starting at pos. Returns false on any
// malformed, overlong or out-of-range sequence.
bool decodeSequence(const std::string& bytes, size_t& pos, uint32_t& code_point) {
    const auto lead = static_cast<unsigned char>(bytes[pos]);

    size_t length = 0;
    uint32_t min_value = 0;
    if (lead < 0x80) {
        code_point = lead;
        ++pos;
        return true;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        code_point = lead & 0x1F;
        min_value = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        code_point = lead & 0x0F;
        min_value = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        code_point = lead & 0x07;
        min_value = 0x10000;
    } else {
        return false;
    }

    if (pos + length > bytes.size()) {
        return false;
    }

    for (size_t i = 1; i < length; ++i) {
        const auto cont = static_cast<unsigned char>(bytes[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            return false;
        }
        code_point = (code_point << 6) | (cont & 0x3F);
    }

    if (code_point < min_value || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return false;
    }

    pos += length;
    return true;
}

} // namespace

std::optional<std::string> Utf8Decoder::decode(const std::string& bytes) const {
    size_t pos = 0;
    uint32_t code_point = 0;
    while (pos < bytes.size()) {
        if (!decodeSequence(bytes, pos, code_point)) {
            return std::nullopt;
        }
    }
    return bytes;
}

std::optional<std::string> Latin1Decoder::decode(const std::string& bytes) const {
    std::string text;
    text.reserve(bytes.size());
    for (char c : bytes) {
        appendUtf8(text, static_cast<unsigned char>(c));
    }
    return text;
}

std::string Latin1Encoder::encode(const std::string& text) const {
    std::string bytes;
    bytes.reserve(text.size());

    size_t pos = 0;
    uint32_t code_point = 0;
    while (pos < text.size()) {
        const size_t start = pos;
        if (!decodeSequence(text, pos, code_point)) {
            throw EncodingError("Malformed UTF-8 at offset " + std::to_string(start));
        }
        if (code_point > 0xFF) {
            std::ostringstream message;
            message << "Character U+" << std::hex << std::uppercase << std::setfill('0')
                    << std::setw(4) << code_point << std::dec
                    << " at offset " << start << " cannot be encoded as latin-1";
            throw EncodingError(message.str());
        }
        bytes += static_cast<char>(code_point);
    }
    return bytes;
}

std::vector<std::unique_ptr<TextDecoder>> defaultDecoders() {
    std::vector<std::unique_ptr<TextDecoder>> decoders;
    decoders.push_back(std::make_unique<Utf8Decoder>());
    decoders.push_back(std::make_unique<Latin1Decoder>());
    return decoders;
}

void appendUtf8(std::string& out, uint32_t code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

} // namespace Resub
