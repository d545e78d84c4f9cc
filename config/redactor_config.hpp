#ifndef PIIREDACT_CONFIG_REDACTOR_CONFIG_HPP
#define PIIREDACT_CONFIG_REDACTOR_CONFIG_HPP

#include <cstddef>
#include <string>
#include "redaction/entity_span.hpp"
#include "util/logger.hpp"

/**
 * @file redactor_config.hpp
 * @brief Deployment settings for the redaction engine and the piiredact tool.
 *
 * USAGE:
 *   - Populate manually, or through util/config_parser.hpp from a key=value file.
 *   - The exclusion list lives here rather than inside the engine so each
 *     deployment can choose which detector kinds are left in the clear.
 */

namespace piiredact {
namespace config {

/**
 * @struct RedactorConfig
 * @brief Holds engine policy and tool settings:
 *   - excludedKinds: detector kinds never redacted (IP addresses by default).
 *   - linePlaceholder / maskCharacters: structural pass settings.
 *   - overlapPolicy / boundsPolicy / offsetUnit: entity pass policy.
 *   - logLevel / logFile: logger setup.
 *   - archivePath: SQLite archive of redacted output; empty disables it.
 *   - workerThreads: batch worker count, 0 picks hardware concurrency.
 */
struct RedactorConfig
{
    RedactorConfig()
        : excludedKinds{"IP_ADDRESS"},
          linePlaceholder(redaction::defaultLinePlaceholder()),
          maskCharacters("*"),
          overlapPolicy(redaction::OverlapPolicy::Reject),
          boundsPolicy(redaction::SpanBoundsPolicy::Reject),
          offsetUnit(redaction::OffsetUnit::CodePoint),
          logLevel(util::logger::LogLevel::INFO),
          workerThreads(0)
    {
    }

    redaction::KindSet excludedKinds;
    std::string linePlaceholder;
    std::string maskCharacters;
    redaction::OverlapPolicy overlapPolicy;
    redaction::SpanBoundsPolicy boundsPolicy;
    redaction::OffsetUnit offsetUnit;
    util::logger::LogLevel logLevel;
    std::string logFile;
    std::string archivePath;
    std::size_t workerThreads;
};

} // namespace config
} // namespace piiredact

#endif // PIIREDACT_CONFIG_REDACTOR_CONFIG_HPP
