#ifndef PIIREDACT_REDACTION_ERRORS_HPP
#define PIIREDACT_REDACTION_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * @file errors.hpp
 * @brief Exception taxonomy for the redaction engine.
 *
 * Every one of these means sensitive content could leak if the caller carried
 * on, so callers must not emit any text downstream after catching one.
 */

namespace piiredact {
namespace redaction {

/**
 * @class RedactionError
 * @brief Common base so callers can fail closed on any engine-level error.
 */
class RedactionError : public std::runtime_error
{
public:
    explicit RedactionError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @class InvalidSpanError
 * @brief A span is reversed, out of bounds, or has no kind.
 */
class InvalidSpanError : public RedactionError
{
public:
    InvalidSpanError(const std::string &reason,
                     const std::string &kind,
                     std::size_t begin,
                     std::size_t end)
        : RedactionError("InvalidSpanError: " + reason + " (kind='" + kind + "', begin="
                         + std::to_string(begin) + ", end=" + std::to_string(end) + ")"),
          kind_(kind), begin_(begin), end_(end)
    {
    }

    const std::string &kind() const { return kind_; }
    std::size_t begin() const { return begin_; }
    std::size_t end() const { return end_; }

private:
    std::string kind_;
    std::size_t begin_;
    std::size_t end_;
};

/**
 * @class OverlapConflictError
 * @brief Two surviving spans overlap while the overlap policy is Reject.
 *        Resolve upstream (e.g. with mergeOverlapping()) and retry.
 */
class OverlapConflictError : public RedactionError
{
public:
    OverlapConflictError(const std::string &firstKind, std::size_t firstBegin, std::size_t firstEnd,
                         const std::string &secondKind, std::size_t secondBegin, std::size_t secondEnd)
        : RedactionError("OverlapConflictError: span " + firstKind + "[" + std::to_string(firstBegin)
                         + "," + std::to_string(firstEnd) + ") overlaps span " + secondKind + "["
                         + std::to_string(secondBegin) + "," + std::to_string(secondEnd) + ")")
    {
    }
};

/**
 * @class EncodingBoundaryError
 * @brief The text is not valid UTF-8, or an offset splits a multi-byte character.
 */
class EncodingBoundaryError : public RedactionError
{
public:
    EncodingBoundaryError(const std::string &reason, std::size_t byteOffset)
        : RedactionError("EncodingBoundaryError: " + reason + " at byte " + std::to_string(byteOffset)),
          byteOffset_(byteOffset)
    {
    }

    std::size_t byteOffset() const { return byteOffset_; }

private:
    std::size_t byteOffset_;
};

} // namespace redaction
} // namespace piiredact

#endif // PIIREDACT_REDACTION_ERRORS_HPP
