#ifndef PIIREDACT_REDACTION_ENTITY_SPAN_HPP
#define PIIREDACT_REDACTION_ENTITY_SPAN_HPP

#include <cstddef>
#include <set>
#include <string>
#include <vector>

/**
 * @file entity_span.hpp
 * @brief Entity span model shared by the detector adapters and the redactors.
 */

namespace piiredact {
namespace redaction {

/**
 * @struct EntitySpan
 * @brief A detected entity: half-open range [begin, end) over the original
 *        text, tagged with the detector's kind label (e.g. "NAME", "SSN").
 */
struct EntitySpan
{
    std::string kind;
    std::size_t begin = 0;
    std::size_t end = 0;

    bool empty() const { return begin == end; }
};

inline bool operator==(const EntitySpan &a, const EntitySpan &b)
{
    return a.kind == b.kind && a.begin == b.begin && a.end == b.end;
}

inline bool operator!=(const EntitySpan &a, const EntitySpan &b)
{
    return !(a == b);
}

using EntityList = std::vector<EntitySpan>;
using KindSet = std::set<std::string>;

/// Unit the detector measured its offsets in.
enum class OffsetUnit {
    CodePoint,
    Byte
};

/// What to do when two surviving spans overlap.
enum class OverlapPolicy {
    Reject,
    Merge
};

/// What to do when a span ends past the end of the original text.
/// Clamp trims such a span to end at the text end. A span that also begins
/// at or past the end covers no text and is dropped (counted as out of range),
/// so no placeholder is ever appended for text that does not exist.
enum class SpanBoundsPolicy {
    Reject,
    Clamp
};

/// Default line placeholder of the structural pass.
inline const std::string &defaultLinePlaceholder()
{
    static const std::string placeholder = "[REDACTED LINE]";
    return placeholder;
}

/// Placeholder substituted for an entity of the given kind.
inline std::string entityPlaceholder(const std::string &kind)
{
    return "[REDACTED " + kind + "]";
}

} // namespace redaction
} // namespace piiredact

#endif // PIIREDACT_REDACTION_ENTITY_SPAN_HPP
