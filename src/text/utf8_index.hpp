#ifndef PIIREDACT_TEXT_UTF8_INDEX_HPP
#define PIIREDACT_TEXT_UTF8_INDEX_HPP

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include "redaction/errors.hpp"

/**
 * @file utf8_index.hpp
 * @brief Code point index over a UTF-8 string.
 *
 * Detectors report offsets in Unicode scalar values while the engine edits
 * std::string bytes. Utf8Index validates the text once and converts between
 * the two coordinate spaces.
 *
 * USAGE:
 *   @code
 *   piiredact::text::Utf8Index index(text);   // throws on malformed UTF-8
 *   std::size_t byteBegin = index.byteOffsetOf(span.begin);
 *   @endcode
 */

namespace piiredact {
namespace text {

class Utf8Index
{
public:
    /**
     * @brief Build the index.
     * @throw redaction::EncodingBoundaryError if text is not well-formed UTF-8
     *        (bad lead byte, truncated sequence, overlong form, surrogate, > U+10FFFF).
     */
    explicit Utf8Index(const std::string &text)
        : byteLength_(text.size())
    {
        starts_.reserve(text.size() + 1);
        std::size_t pos = 0;
        while (pos < text.size()) {
            starts_.push_back(pos);
            pos += sequenceLength(text, pos);
        }
        starts_.push_back(text.size());
    }

    /// Number of code points in the text.
    std::size_t codePointCount() const { return starts_.size() - 1; }

    std::size_t byteLength() const { return byteLength_; }

    /**
     * @brief Byte offset where code point `index` starts; `codePointCount()` maps to the byte length.
     * @throw std::out_of_range if index > codePointCount().
     */
    std::size_t byteOffsetOf(std::size_t index) const
    {
        if (index >= starts_.size()) {
            throw std::out_of_range("Utf8Index: code point index " + std::to_string(index)
                                    + " past end (" + std::to_string(codePointCount()) + ")");
        }
        return starts_[index];
    }

    /// True if `byteOffset` starts a code point or is the end of the text.
    bool isBoundary(std::size_t byteOffset) const
    {
        if (byteOffset > byteLength_) {
            return false;
        }
        auto it = std::lower_bound(starts_.begin(), starts_.end(), byteOffset);
        return it != starts_.end() && *it == byteOffset;
    }

    static bool isContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }

private:
    // Length of the well-formed sequence starting at pos (RFC 3629 table).
    static std::size_t sequenceLength(const std::string &text, std::size_t pos)
    {
        const unsigned char lead = static_cast<unsigned char>(text[pos]);
        if (lead < 0x80) {
            return 1;
        }

        std::size_t length = 0;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) low = 0xA0;
            if (lead == 0xED) high = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) low = 0x90;
            if (lead == 0xF4) high = 0x8F;
        } else {
            throw redaction::EncodingBoundaryError("invalid UTF-8 lead byte", pos);
        }

        if (pos + length > text.size()) {
            throw redaction::EncodingBoundaryError("truncated UTF-8 sequence", pos);
        }
        const unsigned char second = static_cast<unsigned char>(text[pos + 1]);
        if (second < low || second > high) {
            throw redaction::EncodingBoundaryError("invalid UTF-8 continuation byte", pos + 1);
        }
        for (std::size_t i = 2; i < length; ++i) {
            if (!isContinuation(static_cast<unsigned char>(text[pos + i]))) {
                throw redaction::EncodingBoundaryError("invalid UTF-8 continuation byte", pos + i);
            }
        }
        return length;
    }

    std::vector<std::size_t> starts_;
    std::size_t byteLength_;
};

} // namespace text
} // namespace piiredact

#endif // PIIREDACT_TEXT_UTF8_INDEX_HPP
