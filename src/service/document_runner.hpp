#ifndef PIIREDACT_SERVICE_DOCUMENT_RUNNER_HPP
#define PIIREDACT_SERVICE_DOCUMENT_RUNNER_HPP

#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "archive/redaction_archive.hpp"
#include "connectors/entity_detector.hpp"
#include "connectors/text_source.hpp"
#include "redaction/errors.hpp"
#include "redaction/redactor.hpp"
#include "service/batch_redactor.hpp"
#include "service/response.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

/**
 * @file document_runner.hpp
 * @brief One document from input files to emitted output, with the CLI exit codes.
 *
 * DESIGN GOALS:
 *   - Fail closed: on a redaction error nothing reaches the output stream or
 *     the output file, and the run reports ExitRedaction.
 *   - An archive failure is reported after the output is emitted, since the
 *     redacted text is already safe to hand out.
 *   - Output goes to a caller supplied stream unless an output path is set,
 *     so the whole contract runs without a process.
 *
 * USAGE EXAMPLE:
 *   @code
 *   DocumentRequest request;
 *   request.textPath = "scan.txt";
 *   request.entitiesPath = "scan.entities.json";
 *   int code = runDocument(request, redactor, nullptr, std::cout);
 *   @endcode
 */

namespace piiredact {
namespace service {

enum ExitCode {
    ExitOk = 0,
    ExitUsage = 1,          ///< usage, config or input error
    ExitRedaction = 2,      ///< spans could not be applied safely; nothing emitted
    ExitBatchFailures = 3,
    ExitArchive = 4         ///< output emitted, archive write failed
};

struct DocumentRequest
{
    std::string textPath;       ///< "-" reads stdin
    std::string entitiesPath;   ///< empty or "-" for structural pass only
    std::string outputPath;     ///< empty or "-" writes to the stream
    bool json = false;
};

/**
 * @brief Read, redact, emit and archive one document.
 * @param store Optional archive (nullptr disables archiving).
 * @param out Destination when the request has no output path.
 * @return An ExitCode value.
 */
inline int runDocument(const DocumentRequest &request,
                       const redaction::Redactor &redactor,
                       archive::RedactionArchive *store,
                       std::ostream &out)
{
    std::string text;
    redaction::EntityList spans;
    try {
        connectors::FileTextSource source(request.textPath);
        text = source.extractText();
        std::unique_ptr<connectors::EntityDetector> detector;
        if (request.entitiesPath.empty() || request.entitiesPath == "-") {
            detector = std::make_unique<connectors::NoEntityDetector>();
        } else {
            detector = std::make_unique<connectors::JsonEntityFileDetector>(request.entitiesPath);
        }
        spans = detector->detect(text);
    } catch (const redaction::RedactionError &ex) {
        util::logger::error(std::string("[runner] ") + ex.what());
        return ExitRedaction;
    } catch (const std::exception &ex) {
        util::logger::error(std::string("[runner] ") + ex.what());
        return ExitUsage;
    }

    redaction::RedactionResult result;
    try {
        result = redactor.redact(text, spans);
    } catch (const redaction::RedactionError &ex) {
        util::logger::error(std::string("[runner] Redaction refused, nothing emitted: ") + ex.what());
        return ExitRedaction;
    } catch (const std::exception &ex) {
        util::logger::error(std::string("[runner] Redaction failed, nothing emitted: ") + ex.what());
        return ExitRedaction;
    }

    util::logger::info("[runner] Redacted document "
                       + util::hashing::shortDigest(util::hashing::sha256(text)) + ": "
                       + std::to_string(result.linesRedacted) + " line(s), "
                       + std::to_string(result.entitiesRedacted) + " entit(y/ies), "
                       + std::to_string(result.entitiesExcluded) + " excluded");

    std::string payload = request.json ? RedactionResponse(result).toJson() + "\n" : result.text;
    if (request.outputPath.empty() || request.outputPath == "-") {
        out << payload;
        out.flush();
        if (!out) {
            util::logger::error("[runner] Failed writing redacted output");
            return ExitUsage;
        }
    } else {
        try {
            writeOutputFile(request.outputPath, payload);
        } catch (const std::exception &ex) {
            util::logger::error(std::string("[runner] ") + ex.what());
            return ExitUsage;
        }
    }

    if (store && !archiveResult(*store, request.textPath, text, result)) {
        util::logger::error("[runner] Archive write failed for " + store->Path());
        return ExitArchive;
    }
    return ExitOk;
}

/**
 * @brief Exit code for a finished batch. Failed jobs are listed on `err`.
 */
inline int batchExitCode(const std::vector<BatchOutcome> &outcomes, std::ostream &err)
{
    bool anyFailed = false;
    bool anyArchiveFailed = false;
    for (const auto &outcome : outcomes) {
        if (!outcome.succeeded) {
            anyFailed = true;
            err << "FAILED " << outcome.job.textPath << ": " << outcome.errorMessage << "\n";
        } else if (outcome.archiveFailed) {
            anyArchiveFailed = true;
        }
    }
    if (anyFailed) {
        return ExitBatchFailures;
    }
    return anyArchiveFailed ? ExitArchive : ExitOk;
}

} // namespace service
} // namespace piiredact

#endif // PIIREDACT_SERVICE_DOCUMENT_RUNNER_HPP
