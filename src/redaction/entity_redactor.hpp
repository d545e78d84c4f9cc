#ifndef PIIREDACT_REDACTION_ENTITY_REDACTOR_HPP
#define PIIREDACT_REDACTION_ENTITY_REDACTOR_HPP

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include "redaction/entity_span.hpp"
#include "redaction/errors.hpp"
#include "redaction/line_redactor.hpp"
#include "redaction/offset_map.hpp"
#include "text/utf8_index.hpp"
#include "util/logger.hpp"

/**
 * @file entity_redactor.hpp
 * @brief Entity pass: substitutes "[REDACTED <kind>]" for every detected span.
 *
 * DESIGN:
 *   - Spans are expressed against the ORIGINAL text. When the structural pass
 *     ran first, its OffsetMap translates them into the rewritten text.
 *   - Excluded kinds are dropped first. If nothing survives, the text comes
 *     back untouched.
 *   - Everything is validated before the first substitution, so an error
 *     never leaves partially redacted output behind.
 *   - Substitutions run rightmost first (begin desc, end desc). A replacement
 *     only shifts text to its right, so every remaining span still indexes
 *     the text it was computed for.
 *
 * Overlapping spans are rejected by default (OverlapConflictError). With
 * OverlapPolicy::Merge they are first unioned into one span whose kind lists
 * the distinct kinds of the group, e.g. "[REDACTED NAME|ADDRESS]".
 *
 * A zero-width span inserts its placeholder at that position. It conflicts
 * with a span that strictly contains it; one sitting at a span's edge does not.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiredact::redaction;
 *   EntityRedactor redactor;
 *   EntityList spans = {{"NAME", 6, 10}};
 *   std::string out = redactor.redact("Hello John Doe", spans, {"IP_ADDRESS"}).text;
 *   // out == "Hello [REDACTED NAME] Doe"
 *   @endcode
 */

namespace piiredact {
namespace redaction {

struct EntityRedactorOptions
{
    OffsetUnit unit = OffsetUnit::CodePoint;
    OverlapPolicy overlap = OverlapPolicy::Reject;
    SpanBoundsPolicy bounds = SpanBoundsPolicy::Reject;
};

/**
 * @struct EntityRedaction
 * @brief Output of the entity pass plus what happened to the input spans.
 */
struct EntityRedaction
{
    std::string text;
    std::size_t redacted = 0;   ///< placeholders written
    std::size_t excluded = 0;   ///< dropped by kind
    std::size_t merged = 0;     ///< spans folded into another by OverlapPolicy::Merge
    std::size_t absorbed = 0;   ///< lay entirely inside lines the structural pass already replaced
    std::size_t outOfRange = 0; ///< started at or past the text end under SpanBoundsPolicy::Clamp
};

/**
 * @brief Drop every span whose kind is in `excluded`, preserving order.
 */
inline EntityList filterExcludedKinds(const EntityList &spans, const KindSet &excluded)
{
    EntityList kept;
    kept.reserve(spans.size());
    for (const auto &span : spans) {
        if (excluded.find(span.kind) == excluded.end()) {
            kept.push_back(span);
        }
    }
    return kept;
}

namespace detail {

inline bool beginAscending(const EntitySpan &a, const EntitySpan &b)
{
    if (a.begin != b.begin) {
        return a.begin < b.begin;
    }
    return a.end > b.end;
}

inline bool beginDescending(const EntitySpan &a, const EntitySpan &b)
{
    if (a.begin != b.begin) {
        return a.begin > b.begin;
    }
    return a.end > b.end;
}

// Index of the sorted, disjoint range strictly containing `pos`, or ranges.size().
inline std::size_t rangeStrictlyContaining(const EntityList &ranges, std::size_t pos)
{
    auto it = std::upper_bound(ranges.begin(), ranges.end(), pos,
                               [](std::size_t p, const EntitySpan &r) { return p < r.end; });
    if (it != ranges.end() && it->begin < pos) {
        return static_cast<std::size_t>(it - ranges.begin());
    }
    return ranges.size();
}

inline void appendKind(std::string &kinds, const std::string &kind)
{
    std::size_t start = 0;
    while (start <= kinds.size()) {
        std::size_t bar = kinds.find('|', start);
        std::size_t stop = (bar == std::string::npos) ? kinds.size() : bar;
        if (kinds.compare(start, stop - start, kind) == 0) {
            return;
        }
        if (bar == std::string::npos) {
            break;
        }
        start = bar + 1;
    }
    kinds += "|" + kind;
}

} // namespace detail

/**
 * @brief Union overlapping spans so the result can be redacted without conflicts.
 *
 * Non-empty spans that share a position become one span covering their union,
 * with the distinct kinds joined by '|' in begin order. Zero-width spans
 * strictly inside a range are dropped (there is nothing left to redact there).
 * Adjacent spans are not merged. Returns spans sorted by begin, then end descending.
 */
inline EntityList mergeOverlapping(const EntityList &spans)
{
    EntityList ranges;
    EntityList points;
    for (const auto &span : spans) {
        (span.empty() ? points : ranges).push_back(span);
    }
    std::stable_sort(ranges.begin(), ranges.end(), detail::beginAscending);

    EntityList merged;
    for (const auto &span : ranges) {
        if (!merged.empty() && span.begin < merged.back().end) {
            EntitySpan &group = merged.back();
            group.end = std::max(group.end, span.end);
            detail::appendKind(group.kind, span.kind);
        } else {
            merged.push_back(span);
        }
    }

    EntityList result = merged;
    for (const auto &point : points) {
        if (detail::rangeStrictlyContaining(merged, point.begin) == merged.size()) {
            result.push_back(point);
        }
    }
    std::stable_sort(result.begin(), result.end(), detail::beginAscending);
    return result;
}

class EntityRedactor
{
public:
    explicit EntityRedactor(EntityRedactorOptions options = EntityRedactorOptions())
        : options_(options)
    {
    }

    const EntityRedactorOptions &options() const { return options_; }

    /**
     * @brief Redact spans computed against `text` itself (no structural pass).
     */
    EntityRedaction redact(const std::string &text,
                           const EntityList &spans,
                           const KindSet &excludedKinds) const
    {
        LineRedaction untouched;
        untouched.text = text;
        untouched.offsets = OffsetMap(text.size());
        return redact(text, untouched, spans, excludedKinds);
    }

    /**
     * @brief Redact spans computed against `original` in the output of the structural pass.
     * @throw InvalidSpanError, OverlapConflictError, EncodingBoundaryError
     * @throw std::invalid_argument if `structural` was not produced from `original`.
     */
    EntityRedaction redact(const std::string &original,
                           const LineRedaction &structural,
                           const EntityList &spans,
                           const KindSet &excludedKinds) const
    {
        EntityRedaction result;
        EntityList survivors = filterExcludedKinds(spans, excludedKinds);
        result.excluded = spans.size() - survivors.size();
        if (survivors.empty()) {
            result.text = structural.text;
            return result;
        }

        if (structural.offsets.originalLength() != original.size()) {
            throw std::invalid_argument("EntityRedactor: structural pass does not belong to this text");
        }

        const text::Utf8Index index(original);
        const std::size_t length = (options_.unit == OffsetUnit::CodePoint)
                                       ? index.codePointCount()
                                       : index.byteLength();
        result.outOfRange = validate(survivors, length);
        if (survivors.empty()) {
            result.text = structural.text;
            return result;
        }

        EntityList resolved = resolveOverlaps(survivors);
        result.merged = survivors.size() - resolved.size();

        EntityList placed;
        placed.reserve(resolved.size());
        for (const auto &span : resolved) {
            EntitySpan bytes = toByteOffsets(span, index);
            auto mapped = structural.offsets.mapRange(bytes.begin, bytes.end);
            if (!mapped) {
                ++result.absorbed;
                continue;
            }
            placed.push_back(EntitySpan{span.kind, mapped->first, mapped->second});
        }

        std::sort(placed.begin(), placed.end(), detail::beginDescending);

        result.text = structural.text;
        for (const auto &span : placed) {
            result.text.replace(span.begin, span.end - span.begin, entityPlaceholder(span.kind));
        }
        result.redacted = placed.size();

        util::logger::debug("EntityRedactor: redacted=" + std::to_string(result.redacted)
                            + " excluded=" + std::to_string(result.excluded)
                            + " merged=" + std::to_string(result.merged)
                            + " absorbed=" + std::to_string(result.absorbed)
                            + " outOfRange=" + std::to_string(result.outOfRange));
        return result;
    }

private:
    // Returns how many spans were dropped for starting at or past the end.
    std::size_t validate(EntityList &spans, std::size_t length) const
    {
        EntityList kept;
        kept.reserve(spans.size());
        for (auto &span : spans) {
            if (span.kind.empty()) {
                throw InvalidSpanError("span has no kind", span.kind, span.begin, span.end);
            }
            if (span.begin > span.end) {
                throw InvalidSpanError("begin exceeds end", span.kind, span.begin, span.end);
            }
            if (span.end > length) {
                if (options_.bounds == SpanBoundsPolicy::Reject) {
                    throw InvalidSpanError("end exceeds text length " + std::to_string(length),
                                           span.kind, span.begin, span.end);
                }
                if (span.begin >= length) {
                    util::logger::warn("EntityRedactor: dropping " + span.kind + " span ["
                                       + std::to_string(span.begin) + "," + std::to_string(span.end)
                                       + ") past text length " + std::to_string(length));
                    continue;
                }
                util::logger::warn("EntityRedactor: clamping " + span.kind + " span ["
                                   + std::to_string(span.begin) + "," + std::to_string(span.end)
                                   + ") to text length " + std::to_string(length));
                span.end = length;
            }
            kept.push_back(span);
        }
        std::size_t dropped = spans.size() - kept.size();
        spans.swap(kept);
        return dropped;
    }

    EntityList resolveOverlaps(const EntityList &spans) const
    {
        if (options_.overlap == OverlapPolicy::Merge) {
            return mergeOverlapping(spans);
        }

        EntityList ranges;
        EntityList points;
        for (const auto &span : spans) {
            (span.empty() ? points : ranges).push_back(span);
        }
        std::stable_sort(ranges.begin(), ranges.end(), detail::beginAscending);

        for (std::size_t i = 1; i < ranges.size(); ++i) {
            const EntitySpan &previous = ranges[i - 1];
            if (ranges[i].begin < previous.end) {
                throw OverlapConflictError(previous.kind, previous.begin, previous.end,
                                           ranges[i].kind, ranges[i].begin, ranges[i].end);
            }
        }
        for (const auto &point : points) {
            std::size_t at = detail::rangeStrictlyContaining(ranges, point.begin);
            if (at != ranges.size()) {
                throw OverlapConflictError(ranges[at].kind, ranges[at].begin, ranges[at].end,
                                           point.kind, point.begin, point.end);
            }
        }

        EntityList all = ranges;
        all.insert(all.end(), points.begin(), points.end());
        return all;
    }

    EntitySpan toByteOffsets(const EntitySpan &span, const text::Utf8Index &index) const
    {
        if (options_.unit == OffsetUnit::CodePoint) {
            return EntitySpan{span.kind, index.byteOffsetOf(span.begin), index.byteOffsetOf(span.end)};
        }
        if (!index.isBoundary(span.begin)) {
            throw EncodingBoundaryError("span " + span.kind + " begin splits a character", span.begin);
        }
        if (!index.isBoundary(span.end)) {
            throw EncodingBoundaryError("span " + span.kind + " end splits a character", span.end);
        }
        return span;
    }

    EntityRedactorOptions options_;
};

/**
 * @brief Entity pass with default options (code point offsets, reject overlaps and
 *        out-of-bounds spans) over spans computed against `text` itself.
 */
inline std::string redactEntities(const std::string &text,
                                  const EntityList &spans,
                                  const KindSet &excludedKinds)
{
    return EntityRedactor().redact(text, spans, excludedKinds).text;
}

} // namespace redaction
} // namespace piiredact

#endif // PIIREDACT_REDACTION_ENTITY_REDACTOR_HPP
