#ifndef PIIREDACT_CONNECTORS_ENTITY_DETECTOR_HPP
#define PIIREDACT_CONNECTORS_ENTITY_DETECTOR_HPP

#include <string>
#include "connectors/entity_json.hpp"
#include "connectors/text_source.hpp"
#include "redaction/entity_span.hpp"
#include "util/logger.hpp"

/**
 * @file entity_detector.hpp
 * @brief Where entity spans come from.
 *
 * Detection runs upstream against the exact text handed to the engine. The
 * engine assumes nothing about the order or uniqueness of what comes back.
 */

namespace piiredact {
namespace connectors {

/**
 * @class EntityDetector
 * @brief Produces the entity spans found in a text.
 */
class EntityDetector
{
public:
    virtual ~EntityDetector() = default;

    /**
     * @param text The text the spans must index into.
     * @throw std::runtime_error if detection output cannot be obtained or parsed.
     */
    virtual redaction::EntityList detect(const std::string &text) = 0;
};

/**
 * @class JsonEntityFileDetector
 * @brief Replays a saved detector response (see entity_json.hpp for the format).
 *
 * The response must have been produced for the same text passed to detect();
 * the engine's bounds and encoding checks catch most mismatches.
 */
class JsonEntityFileDetector : public EntityDetector
{
public:
    explicit JsonEntityFileDetector(const std::string &path)
        : path_(path)
    {
    }

    redaction::EntityList detect(const std::string &text) override
    {
        redaction::EntityList spans = parseEntityJson(readWholeFile(path_));
        util::logger::info("JsonEntityFileDetector: " + std::to_string(spans.size())
                           + " entities for a " + std::to_string(text.size()) + "-byte text from " + path_);
        return spans;
    }

private:
    std::string path_;
};

/**
 * @class NoEntityDetector
 * @brief Detects nothing; only the structural pass applies.
 */
class NoEntityDetector : public EntityDetector
{
public:
    redaction::EntityList detect(const std::string &) override
    {
        return {};
    }
};

} // namespace connectors
} // namespace piiredact

#endif // PIIREDACT_CONNECTORS_ENTITY_DETECTOR_HPP
