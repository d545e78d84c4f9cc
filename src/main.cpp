#include <cstddef>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "archive/redaction_archive.hpp"
#include "config/redactor_config.hpp"
#include "redaction/redactor.hpp"
#include "service/batch_redactor.hpp"
#include "service/document_runner.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace logger = piiredact::util::logger;

namespace {

using piiredact::service::ExitOk;
using piiredact::service::ExitUsage;

struct Options {
    std::string configPath;
    std::string textPath;
    std::string entitiesPath;
    std::string outputPath;
    std::string manifestPath;
    bool json = false;
    bool help = false;

    // Overrides applied on top of the config file.
    std::vector<std::string> extraExcludes;
    std::string overlap;
    std::string bounds;
    std::string offsets;
    std::string archivePath;
    std::string logLevel;
    std::string threads;
};

void printUsage(std::ostream& out) {
    out << "usage:\n"
        << "  piiredact [--config FILE] --text FILE [--entities FILE] [--output FILE]\n"
        << "            [--json] [--exclude KIND]... [--overlap reject|merge]\n"
        << "            [--bounds reject|clamp] [--offsets codepoint|byte]\n"
        << "            [--archive DB] [--log-level LEVEL]\n"
        << "  piiredact [--config FILE] --batch MANIFEST [--threads N]\n"
        << "\n"
        << "  --text -  reads the document from stdin.\n"
        << "  Manifest lines: <text> <entities|-> <output>\n";
}

bool takeValue(int argc, char** argv, int& i, const std::string& flag, std::string& value,
               std::string& error) {
    if (i + 1 >= argc) {
        error = flag + " requires a value";
        return false;
    }
    value = argv[++i];
    return true;
}

bool parseArgs(int argc, char** argv, Options& out, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool ok = true;
        if (arg == "-h" || arg == "--help") {
            out.help = true;
        } else if (arg == "--json") {
            out.json = true;
        } else if (arg == "--config") {
            ok = takeValue(argc, argv, i, arg, out.configPath, error);
        } else if (arg == "--text") {
            ok = takeValue(argc, argv, i, arg, out.textPath, error);
        } else if (arg == "--entities") {
            ok = takeValue(argc, argv, i, arg, out.entitiesPath, error);
        } else if (arg == "--output" || arg == "-o") {
            ok = takeValue(argc, argv, i, arg, out.outputPath, error);
        } else if (arg == "--batch") {
            ok = takeValue(argc, argv, i, arg, out.manifestPath, error);
        } else if (arg == "--exclude") {
            std::string kind;
            ok = takeValue(argc, argv, i, arg, kind, error);
            if (ok) {
                out.extraExcludes.push_back(kind);
            }
        } else if (arg == "--overlap") {
            ok = takeValue(argc, argv, i, arg, out.overlap, error);
        } else if (arg == "--bounds") {
            ok = takeValue(argc, argv, i, arg, out.bounds, error);
        } else if (arg == "--offsets") {
            ok = takeValue(argc, argv, i, arg, out.offsets, error);
        } else if (arg == "--archive") {
            ok = takeValue(argc, argv, i, arg, out.archivePath, error);
        } else if (arg == "--log-level") {
            ok = takeValue(argc, argv, i, arg, out.logLevel, error);
        } else if (arg == "--threads") {
            ok = takeValue(argc, argv, i, arg, out.threads, error);
        } else {
            error = "unknown argument: " + arg;
            return false;
        }
        if (!ok) {
            return false;
        }
    }

    if (out.help) {
        return true;
    }
    if (out.textPath.empty() == out.manifestPath.empty()) {
        error = "exactly one of --text or --batch is required";
        return false;
    }
    if (!out.manifestPath.empty() && (!out.entitiesPath.empty() || !out.outputPath.empty() || out.json)) {
        error = "--entities, --output and --json apply to single-document mode only";
        return false;
    }
    return true;
}

// Config file first, then command-line overrides. Throws std::runtime_error on a bad value.
void applyOverrides(const Options& options, piiredact::config::RedactorConfig& cfg) {
    namespace util = piiredact::util;
    for (const auto& kind : options.extraExcludes) {
        for (const auto& parsed : util::parseKindList(kind)) {
            cfg.excludedKinds.insert(parsed);
        }
    }
    if (!options.overlap.empty()) {
        cfg.overlapPolicy = util::parseOverlapPolicy(options.overlap);
    }
    if (!options.bounds.empty()) {
        cfg.boundsPolicy = util::parseBoundsPolicy(options.bounds);
    }
    if (!options.offsets.empty()) {
        cfg.offsetUnit = util::parseOffsetUnit(options.offsets);
    }
    if (!options.archivePath.empty()) {
        cfg.archivePath = options.archivePath;
    }
    if (!options.logLevel.empty()) {
        cfg.logLevel = logger::parseLogLevel(options.logLevel);
    }
    if (!options.threads.empty()) {
        cfg.workerThreads = static_cast<std::size_t>(util::parseUInt(options.threads));
    }
}

int runSingle(const Options& options, const piiredact::redaction::Redactor& redactor,
              piiredact::archive::RedactionArchive* store) {
    piiredact::service::DocumentRequest request;
    request.textPath = options.textPath;
    request.entitiesPath = options.entitiesPath;
    request.outputPath = options.outputPath;
    request.json = options.json;
    return piiredact::service::runDocument(request, redactor, store, std::cout);
}

int runBatch(const Options& options, const piiredact::redaction::Redactor& redactor,
             piiredact::archive::RedactionArchive* store, std::size_t threads) {
    using namespace piiredact;

    std::vector<service::BatchJob> jobs;
    try {
        jobs = service::loadManifest(options.manifestPath);
    } catch (const std::exception& ex) {
        logger::error(std::string("[main] ") + ex.what());
        return ExitUsage;
    }
    logger::info("[main] Batch of " + std::to_string(jobs.size()) + " document(s) from "
                 + options.manifestPath);

    service::BatchRedactor batch(redactor, store, threads);
    return service::batchExitCode(batch.run(jobs), std::cerr);
}

} // namespace

int main(int argc, char** argv) {
    Options options;
    std::string argError;
    if (!parseArgs(argc, argv, options, argError)) {
        std::cerr << "piiredact: " << argError << "\n";
        printUsage(std::cerr);
        return ExitUsage;
    }
    if (options.help) {
        printUsage(std::cout);
        return ExitOk;
    }

    piiredact::config::RedactorConfig cfg;
    try {
        if (!options.configPath.empty()) {
            piiredact::util::ConfigParser parser(cfg);
            if (!parser.loadFromFile(options.configPath)) {
                logger::error("[main] Config file not found: " + options.configPath);
                return ExitUsage;
            }
        }
        applyOverrides(options, cfg);
    } catch (const std::exception& ex) {
        std::cerr << "piiredact: " << ex.what() << "\n";
        return ExitUsage;
    }

    logger::setLogLevel(cfg.logLevel);
    if (!cfg.logFile.empty() && !logger::enableFileOutput(cfg.logFile, true)) {
        logger::warn("[main] Could not open log file " + cfg.logFile + ", logging to stderr only");
    }

    std::unique_ptr<piiredact::redaction::Redactor> redactor;
    try {
        redactor = std::make_unique<piiredact::redaction::Redactor>(cfg);
    } catch (const std::exception& ex) {
        logger::error(std::string("[main] Invalid redactor settings: ") + ex.what());
        return ExitUsage;
    }

    std::unique_ptr<piiredact::archive::RedactionArchive> store;
    if (!cfg.archivePath.empty()) {
        store = std::make_unique<piiredact::archive::RedactionArchive>(cfg.archivePath);
    }

    if (!options.manifestPath.empty()) {
        return runBatch(options, *redactor, store.get(), cfg.workerThreads);
    }
    return runSingle(options, *redactor, store.get());
}
