#ifndef PIIREDACT_REDACTION_OFFSET_MAP_HPP
#define PIIREDACT_REDACTION_OFFSET_MAP_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @file offset_map.hpp
 * @brief Records the byte ranges a rewrite pass replaced, so offsets taken
 *        against the original text can be translated into the rewritten one.
 *
 * The structural line pass changes the length of the text before entity spans
 * are applied. Entity spans are still expressed against the original, so the
 * entity pass asks this map where each span landed.
 *
 * Translation rules for an edit that replaced original [b, e) by a placeholder:
 *   - positions before b are shifted by the accumulated length delta;
 *   - a span begin inside [b, e) moves to just after the placeholder;
 *   - a span end inside (b, e] moves to just before the placeholder;
 *   - a span that ends up empty this way was entirely rewritten and is dropped.
 */

namespace piiredact {
namespace redaction {

/**
 * @struct TextEdit
 * @brief One replacement: original bytes [begin, end) became `replacementLength` bytes.
 */
struct TextEdit
{
    std::size_t begin = 0;
    std::size_t end = 0;
    std::size_t replacementLength = 0;
};

class OffsetMap
{
public:
    explicit OffsetMap(std::size_t originalLength = 0)
        : originalLength_(originalLength),
          rewrittenLength_(originalLength)
    {
    }

    /**
     * @brief Record an edit. Edits must be non-empty, in bounds, and added left to right
     *        without overlapping.
     * @throw std::invalid_argument on a violation.
     */
    void addEdit(std::size_t begin, std::size_t end, std::size_t replacementLength)
    {
        if (begin >= end || end > originalLength_) {
            throw std::invalid_argument("OffsetMap: edit [" + std::to_string(begin) + ","
                                        + std::to_string(end) + ") is empty or out of bounds");
        }
        if (!edits_.empty() && begin < edits_.back().end) {
            throw std::invalid_argument("OffsetMap: edits must be added in order without overlap");
        }
        edits_.push_back(TextEdit{begin, end, replacementLength});
        rewrittenLength_ = rewrittenLength_ - (end - begin) + replacementLength;
    }

    std::size_t originalLength() const { return originalLength_; }
    std::size_t rewrittenLength() const { return rewrittenLength_; }
    const std::vector<TextEdit> &edits() const { return edits_; }
    bool isIdentity() const { return edits_.empty(); }

    /**
     * @brief Translate original [begin, end) into rewritten coordinates.
     * @return std::nullopt if the range lies entirely inside rewritten regions.
     */
    std::optional<std::pair<std::size_t, std::size_t>> mapRange(std::size_t begin, std::size_t end) const
    {
        if (begin > end || end > originalLength_) {
            throw std::out_of_range("OffsetMap: range [" + std::to_string(begin) + ","
                                    + std::to_string(end) + ") outside original text");
        }
        if (begin == end) {
            auto point = mapPoint(begin);
            if (!point) {
                return std::nullopt;
            }
            return std::make_pair(*point, *point);
        }

        std::size_t mappedBegin = mapBegin(begin);
        std::size_t mappedEnd = mapEnd(end);
        if (mappedBegin >= mappedEnd) {
            return std::nullopt;
        }
        return std::make_pair(mappedBegin, mappedEnd);
    }

private:
    // Positions are unsigned, so the running delta is applied as (pos + grown - shrunk).
    std::size_t mapBegin(std::size_t pos) const
    {
        std::size_t grown = 0;
        std::size_t shrunk = 0;
        for (const auto &edit : edits_) {
            if (pos < edit.begin) {
                break;
            }
            if (pos < edit.end) {
                return edit.begin + grown - shrunk + edit.replacementLength;
            }
            grown += edit.replacementLength;
            shrunk += edit.end - edit.begin;
        }
        return pos + grown - shrunk;
    }

    std::size_t mapEnd(std::size_t pos) const
    {
        std::size_t grown = 0;
        std::size_t shrunk = 0;
        for (const auto &edit : edits_) {
            if (pos <= edit.begin) {
                break;
            }
            if (pos <= edit.end) {
                return edit.begin + grown - shrunk;
            }
            grown += edit.replacementLength;
            shrunk += edit.end - edit.begin;
        }
        return pos + grown - shrunk;
    }

    // Zero-width position: swallowed if strictly inside an edit.
    std::optional<std::size_t> mapPoint(std::size_t pos) const
    {
        std::size_t grown = 0;
        std::size_t shrunk = 0;
        for (const auto &edit : edits_) {
            if (pos <= edit.begin) {
                break;
            }
            if (pos < edit.end) {
                return std::nullopt;
            }
            grown += edit.replacementLength;
            shrunk += edit.end - edit.begin;
        }
        return pos + grown - shrunk;
    }

    std::size_t originalLength_;
    std::size_t rewrittenLength_;
    std::vector<TextEdit> edits_;
};

} // namespace redaction
} // namespace piiredact

#endif // PIIREDACT_REDACTION_OFFSET_MAP_HPP
