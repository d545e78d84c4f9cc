#ifndef PIIREDACT_SERVICE_BATCH_REDACTOR_HPP
#define PIIREDACT_SERVICE_BATCH_REDACTOR_HPP

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include "archive/redaction_archive.hpp"
#include "connectors/entity_detector.hpp"
#include "connectors/text_source.hpp"
#include "redaction/errors.hpp"
#include "redaction/redactor.hpp"
#include "util/config_parser.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"

/**
 * @file batch_redactor.hpp
 * @brief Runs many independent documents through one shared Redactor.
 *
 * DESIGN GOALS:
 *   - Each job reads its own text and detector output, redacts, and writes its
 *     own output file. Jobs share nothing but the immutable Redactor and the
 *     (internally locked) archive.
 *   - Fail closed per document: a job that fails writes no output at all.
 *     Output goes to "<output>.partial" first and is renamed into place only
 *     once complete.
 *   - A failed job never stops the others; its error is reported in its outcome.
 *
 * Manifest format (one job per line, blank lines skipped). '#' starts a comment
 * at the start of a line or after whitespace; inside a path it is kept:
 *   @code
 *   scans/0001.txt   scans/0001.entities.json   out/0001.txt
 *   scans/0002.txt   -                          out/0002.txt     # no detector output
 *   @endcode
 */

namespace piiredact {
namespace service {

struct BatchJob
{
    std::string textPath;
    std::string entitiesPath;   ///< "-" when there is no detector output
    std::string outputPath;
};

struct BatchOutcome
{
    BatchJob job;
    bool succeeded = false;
    bool archiveFailed = false;
    std::string errorMessage;
    redaction::RedactionResult result;
};

/**
 * @brief Parse manifest text into jobs.
 * @throw std::runtime_error on a line that does not have exactly three fields.
 */
inline std::vector<BatchJob> parseManifest(const std::string &content)
{
    std::vector<BatchJob> jobs;
    std::istringstream in(content);
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        for (std::size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
                line.erase(i);
                break;
            }
        }
        util::trim(line);
        if (line.empty()) {
            continue;
        }
        std::istringstream fields(line);
        BatchJob job;
        std::string extra;
        if (!(fields >> job.textPath >> job.entitiesPath >> job.outputPath) || (fields >> extra)) {
            throw std::runtime_error("parseManifest: line " + std::to_string(lineNumber)
                                     + " must be '<text> <entities|-> <output>'");
        }
        jobs.push_back(job);
    }
    return jobs;
}

inline std::vector<BatchJob> loadManifest(const std::string &path)
{
    return parseManifest(connectors::readWholeFile(path));
}

/**
 * @brief Write `content` to `path` through a temporary file, so a reader never sees a partial file.
 * @throw std::runtime_error on any I/O failure (the temporary is removed).
 */
inline void writeOutputFile(const std::string &path, const std::string &content)
{
    const std::string partial = path + ".partial";
    {
        std::ofstream out(partial, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("writeOutputFile: cannot open " + partial);
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            std::filesystem::remove(partial, ignored);
            throw std::runtime_error("writeOutputFile: write failed for " + partial);
        }
    }
    std::error_code ec;
    std::filesystem::rename(partial, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(partial, ignored);
        throw std::runtime_error("writeOutputFile: cannot move output into place at " + path
                                 + ": " + ec.message());
    }
}

/**
 * @brief Archive a finished redaction. Returns false if the archive rejected it.
 */
inline bool archiveResult(archive::RedactionArchive &store,
                          const std::string &documentName,
                          const std::string &originalText,
                          const redaction::RedactionResult &result)
{
    archive::ArchiveRecord record;
    record.documentName = documentName;
    record.sourceDigest = util::hashing::sha256(originalText);
    record.redactedDigest = util::hashing::sha256(result.text);
    record.linesRedacted = result.linesRedacted;
    record.entitiesRedacted = result.entitiesRedacted;
    record.redactedText = result.text;
    return store.Store(record);
}

class BatchRedactor
{
public:
    /**
     * @param redactor Shared pipeline; must outlive this object.
     * @param store Optional archive (nullptr disables archiving); must outlive this object.
     * @param threads Worker count, 0 picks hardware concurrency.
     */
    BatchRedactor(const redaction::Redactor &redactor, archive::RedactionArchive *store, std::size_t threads)
        : redactor_(redactor), store_(store), threads_(threads)
    {
    }

    /**
     * @brief Run every job; outcomes come back in job order.
     */
    std::vector<BatchOutcome> run(const std::vector<BatchJob> &jobs) const
    {
        std::vector<BatchOutcome> outcomes;
        outcomes.reserve(jobs.size());
        if (jobs.empty()) {
            return outcomes;
        }

        std::size_t workers = (threads_ == 0) ? std::thread::hardware_concurrency() : threads_;
        workers = std::max<std::size_t>(1, std::min(workers, jobs.size()));
        util::ThreadPool pool(workers);
        std::vector<std::future<BatchOutcome>> pending;
        pending.reserve(jobs.size());
        for (const auto &job : jobs) {
            pending.push_back(pool.enqueue([this, job] { return runJob(job); }));
        }
        for (auto &future : pending) {
            outcomes.push_back(future.get());
        }

        std::size_t failed = 0;
        for (const auto &outcome : outcomes) {
            if (!outcome.succeeded) {
                ++failed;
            }
        }
        util::logger::info("BatchRedactor: " + std::to_string(jobs.size() - failed) + " of "
                           + std::to_string(jobs.size()) + " document(s) redacted");
        return outcomes;
    }

    /**
     * @brief Run one job on the calling thread. Never throws; failures land in the outcome.
     */
    BatchOutcome runJob(const BatchJob &job) const
    {
        BatchOutcome outcome;
        outcome.job = job;
        try {
            connectors::FileTextSource source(job.textPath);
            std::string text = source.extractText();

            redaction::EntityList spans;
            if (job.entitiesPath == "-") {
                connectors::NoEntityDetector none;
                spans = none.detect(text);
            } else {
                connectors::JsonEntityFileDetector detector(job.entitiesPath);
                spans = detector.detect(text);
            }

            outcome.result = redactor_.redact(text, spans);
            writeOutputFile(job.outputPath, outcome.result.text);
            outcome.succeeded = true;

            if (store_ && !archiveResult(*store_, job.textPath, text, outcome.result)) {
                outcome.archiveFailed = true;
            }
        } catch (const redaction::RedactionError &ex) {
            outcome.errorMessage = ex.what();
            util::logger::error("BatchRedactor: refusing to emit " + job.outputPath + ": " + ex.what());
        } catch (const std::exception &ex) {
            outcome.errorMessage = ex.what();
            util::logger::error("BatchRedactor: job for " + job.textPath + " failed: " + ex.what());
        }
        return outcome;
    }

private:
    const redaction::Redactor &redactor_;
    archive::RedactionArchive *store_;
    std::size_t threads_;
};

} // namespace service
} // namespace piiredact

#endif // PIIREDACT_SERVICE_BATCH_REDACTOR_HPP
