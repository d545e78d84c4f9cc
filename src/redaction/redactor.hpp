#ifndef PIIREDACT_REDACTION_REDACTOR_HPP
#define PIIREDACT_REDACTION_REDACTOR_HPP

#include <cstddef>
#include <string>
#include <utility>
#include "config/redactor_config.hpp"
#include "redaction/entity_redactor.hpp"
#include "redaction/entity_span.hpp"
#include "redaction/line_redactor.hpp"

/**
 * @file redactor.hpp
 * @brief The two-stage redaction pipeline: masked-number lines, then entity spans.
 *
 * raw text -> LineRedactor -> intermediate text (+ offset map)
 *          -> EntityRedactor (spans in original coordinates) -> redacted text
 *
 * A Redactor is immutable once built; redact() is const and safe to call from
 * several threads at once.
 *
 * USAGE EXAMPLE:
 *   @code
 *   piiredact::config::RedactorConfig cfg;          // excludes IP_ADDRESS
 *   piiredact::redaction::Redactor redactor(cfg);
 *   RedactionResult r = redactor.redact(text, spans);
 *   emit(r.text);
 *   @endcode
 */

namespace piiredact {
namespace redaction {

/**
 * @struct RedactionResult
 * @brief Final text plus per-stage counts for logging and archiving.
 */
struct RedactionResult
{
    std::string text;
    std::size_t linesRedacted = 0;
    std::size_t entitiesRedacted = 0;
    std::size_t entitiesExcluded = 0;
    std::size_t entitiesMerged = 0;
    std::size_t entitiesAbsorbed = 0;
    std::size_t entitiesOutOfRange = 0;
};

class Redactor
{
public:
    /**
     * @throw std::invalid_argument if the line placeholder or mask set is unusable.
     */
    explicit Redactor(const config::RedactorConfig &cfg)
        : lineRedactor_(cfg.linePlaceholder, cfg.maskCharacters),
          entityRedactor_(EntityRedactorOptions{cfg.offsetUnit, cfg.overlapPolicy, cfg.boundsPolicy}),
          excludedKinds_(cfg.excludedKinds)
    {
    }

    /**
     * @brief Run both passes. `spans` are offsets into `text`.
     * @throw RedactionError (or a subclass) when the spans cannot be applied safely.
     */
    RedactionResult redact(const std::string &text, const EntityList &spans) const
    {
        LineRedaction structural = lineRedactor_.redact(text);
        EntityRedaction entities = entityRedactor_.redact(text, structural, spans, excludedKinds_);

        RedactionResult result;
        result.text = std::move(entities.text);
        result.linesRedacted = structural.linesRedacted;
        result.entitiesRedacted = entities.redacted;
        result.entitiesExcluded = entities.excluded;
        result.entitiesMerged = entities.merged;
        result.entitiesAbsorbed = entities.absorbed;
        result.entitiesOutOfRange = entities.outOfRange;
        return result;
    }

    const LineRedactor &lineRedactor() const { return lineRedactor_; }
    const EntityRedactor &entityRedactor() const { return entityRedactor_; }
    const KindSet &excludedKinds() const { return excludedKinds_; }

private:
    LineRedactor lineRedactor_;
    EntityRedactor entityRedactor_;
    KindSet excludedKinds_;
};

} // namespace redaction
} // namespace piiredact

#endif // PIIREDACT_REDACTION_REDACTOR_HPP
