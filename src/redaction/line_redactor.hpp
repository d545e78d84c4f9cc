#ifndef PIIREDACT_REDACTION_LINE_REDACTOR_HPP
#define PIIREDACT_REDACTION_LINE_REDACTOR_HPP

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include "redaction/entity_span.hpp"
#include "redaction/offset_map.hpp"
#include "util/logger.hpp"

/**
 * @file line_redactor.hpp
 * @brief Structural pass: blanks out every line that carries a masked number.
 *
 * A line qualifies when it contains a run of mask characters immediately
 * followed by digits, e.g. "Account: ****1234" or "Card ***9876 exp 04/27".
 * The whole line content is replaced by one placeholder, however many
 * qualifying runs it holds. Line separators ("\n", and the "\r" of "\r\n")
 * are kept, so a run split across a line break never matches.
 * Matching is one forward scan per line, linear in the line length.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiredact::redaction;
 *   LineRedactor lines;                       // "*" mask, "[REDACTED LINE]"
 *   LineRedaction pass = lines.redact(text);
 *   // pass.text is the rewritten text, pass.offsets maps original offsets into it
 *   @endcode
 */

namespace piiredact {
namespace redaction {

/**
 * @struct LineRedaction
 * @brief Result of the structural pass.
 */
struct LineRedaction
{
    std::string text;
    OffsetMap offsets;
    std::size_t linesRedacted = 0;
};

class LineRedactor
{
public:
    /**
     * @param placeholder Replacement for a qualifying line.
     * @param maskCharacters Characters that count as masking (ASCII, no digits, no line breaks).
     * @throw std::invalid_argument if the mask set is unusable, or if the placeholder
     *        spans lines or would itself qualify (the pass must stay idempotent).
     */
    explicit LineRedactor(const std::string &placeholder = defaultLinePlaceholder(),
                          const std::string &maskCharacters = "*")
        : placeholder_(placeholder),
          maskCharacters_(maskCharacters),
          mask_(buildMaskTable(maskCharacters))
    {
        if (placeholder_.find_first_of("\r\n") != std::string::npos) {
            throw std::invalid_argument("LineRedactor: placeholder must not contain a line break");
        }
        if (containsMaskedNumber(placeholder_, 0, placeholder_.size())) {
            throw std::invalid_argument("LineRedactor: placeholder '" + placeholder_
                                        + "' matches the masked-number signature");
        }
    }

    /**
     * @brief Run the pass and keep the edit record.
     */
    LineRedaction redact(const std::string &text) const
    {
        LineRedaction result;
        result.offsets = OffsetMap(text.size());
        result.text.reserve(text.size());

        std::size_t lineStart = 0;
        while (lineStart <= text.size()) {
            std::size_t newline = text.find('\n', lineStart);
            std::size_t lineEnd = (newline == std::string::npos) ? text.size() : newline;
            std::size_t contentEnd = lineEnd;
            if (contentEnd > lineStart && text[contentEnd - 1] == '\r') {
                --contentEnd;
            }

            if (lineQualifies(text, lineStart, contentEnd)) {
                result.text += placeholder_;
                result.offsets.addEdit(lineStart, contentEnd, placeholder_.size());
                ++result.linesRedacted;
            } else {
                result.text.append(text, lineStart, contentEnd - lineStart);
            }
            result.text.append(text, contentEnd, lineEnd - contentEnd);

            if (newline == std::string::npos) {
                break;
            }
            result.text += '\n';
            lineStart = newline + 1;
        }

        if (result.linesRedacted > 0) {
            util::logger::debug("LineRedactor: redacted " + std::to_string(result.linesRedacted)
                                + " masked-number line(s)");
        }
        return result;
    }

    /**
     * @brief Run the pass and return only the text.
     */
    std::string redactLines(const std::string &text) const
    {
        return redact(text).text;
    }

    const std::string &placeholder() const { return placeholder_; }
    const std::string &maskCharacters() const { return maskCharacters_; }

private:
    bool lineQualifies(const std::string &text, std::size_t begin, std::size_t end) const
    {
        // Shortest qualifying line is one mask character plus one digit.
        if (end - begin < 2) {
            return false;
        }
        return containsMaskedNumber(text, begin, end);
    }

    // True if [begin, end) holds a mask run directly followed by a digit.
    bool containsMaskedNumber(const std::string &text, std::size_t begin, std::size_t end) const
    {
        std::size_t pos = begin;
        while (pos < end) {
            if (!isMask(text[pos])) {
                ++pos;
                continue;
            }
            while (pos < end && isMask(text[pos])) {
                ++pos;
            }
            if (pos < end && text[pos] >= '0' && text[pos] <= '9') {
                return true;
            }
        }
        return false;
    }

    bool isMask(char c) const
    {
        return mask_[static_cast<unsigned char>(c)];
    }

    static std::array<bool, 256> buildMaskTable(const std::string &maskCharacters)
    {
        if (maskCharacters.empty()) {
            throw std::invalid_argument("LineRedactor: mask character set is empty");
        }
        std::array<bool, 256> table{};
        for (char c : maskCharacters) {
            unsigned char u = static_cast<unsigned char>(c);
            if (u >= 0x80 || u < 0x20 || (c >= '0' && c <= '9')) {
                throw std::invalid_argument("LineRedactor: unusable mask character (code "
                                            + std::to_string(u) + ")");
            }
            table[u] = true;
        }
        return table;
    }

    std::string placeholder_;
    std::string maskCharacters_;
    std::array<bool, 256> mask_;
};

/**
 * @brief Structural pass with the default placeholder and "*" mask.
 */
inline std::string redactLines(const std::string &text)
{
    static const LineRedactor defaultRedactor;
    return defaultRedactor.redactLines(text);
}

} // namespace redaction
} // namespace piiredact

#endif // PIIREDACT_REDACTION_LINE_REDACTOR_HPP
