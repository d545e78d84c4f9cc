#ifndef PIIREDACT_UTIL_CONFIG_PARSER_HPP
#define PIIREDACT_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <algorithm>
#include <cctype>
#include <mutex>
#include "config/redactor_config.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Parser for piiredact's key=value configuration file.
 *
 * DESIGN GOALS:
 *   - Read a simple "key=value" style configuration file, '#' starts a comment line.
 *   - Populate piiredact::config::RedactorConfig fields.
 *   - A missing file is not an error: the defaults stay in place.
 *   - A malformed line or an unparsable value throws, unknown keys only warn.
 *
 * USAGE:
 *   @code
 *   piiredact::config::RedactorConfig cfg;
 *   piiredact::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("piiredact.conf");
 *   @endcode
 *
 * Example file:
 *   @code
 *   excludedKinds = IP_ADDRESS, URL
 *   overlapPolicy = merge
 *   offsetUnit    = codepoint
 *   archivePath   = /var/lib/piiredact/archive.sqlite
 *   @endcode
 */

namespace piiredact {
namespace util {

inline std::string toLowerCopy(const std::string &s)
{
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

/**
 * @brief Trim leading/trailing whitespace from a string in place.
 */
inline void trim(std::string &s)
{
    static const std::string whitespace = " \t\r\n";
    auto pos = s.find_first_not_of(whitespace);
    if (pos == std::string::npos) {
        s.clear();
        return;
    }
    s.erase(0, pos);
    pos = s.find_last_not_of(whitespace);
    s.erase(pos + 1);
}

/**
 * @brief Split a comma-separated list, trimming entries and skipping empty ones.
 */
inline redaction::KindSet parseKindList(const std::string &val)
{
    redaction::KindSet kinds;
    std::istringstream in(val);
    std::string item;
    while (std::getline(in, item, ',')) {
        trim(item);
        if (!item.empty()) {
            kinds.insert(item);
        }
    }
    return kinds;
}

inline redaction::OverlapPolicy parseOverlapPolicy(const std::string &val)
{
    std::string lower = toLowerCopy(val);
    if (lower == "reject") return redaction::OverlapPolicy::Reject;
    if (lower == "merge") return redaction::OverlapPolicy::Merge;
    throw std::runtime_error("ConfigParser: overlapPolicy must be 'reject' or 'merge', got '" + val + "'");
}

inline redaction::SpanBoundsPolicy parseBoundsPolicy(const std::string &val)
{
    std::string lower = toLowerCopy(val);
    if (lower == "reject") return redaction::SpanBoundsPolicy::Reject;
    if (lower == "clamp") return redaction::SpanBoundsPolicy::Clamp;
    throw std::runtime_error("ConfigParser: boundsPolicy must be 'reject' or 'clamp', got '" + val + "'");
}

inline redaction::OffsetUnit parseOffsetUnit(const std::string &val)
{
    std::string lower = toLowerCopy(val);
    if (lower == "codepoint" || lower == "char" || lower == "character") return redaction::OffsetUnit::CodePoint;
    if (lower == "byte") return redaction::OffsetUnit::Byte;
    throw std::runtime_error("ConfigParser: offsetUnit must be 'codepoint' or 'byte', got '" + val + "'");
}

/**
 * @brief Parse a string into an unsigned integer. If invalid, throw.
 */
inline uint64_t parseUInt(const std::string &val)
{
    try {
        if (val.empty() || val[0] == '-' || val[0] == '+') {
            throw std::runtime_error("not an unsigned number");
        }
        size_t idx = 0;
        uint64_t n = std::stoull(val, &idx, 10);
        if (idx != val.size()) {
            throw std::runtime_error("Non-numeric suffix");
        }
        return n;
    }
    catch (const std::exception &ex) {
        throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
    }
}

/**
 * @class ConfigParser
 * @brief Reads a plain text key=value config and updates RedactorConfig fields.
 */
class ConfigParser
{
public:
    explicit ConfigParser(config::RedactorConfig &redactorConfig)
        : config_(redactorConfig)
    {
    }

    /**
     * @brief Read the given file, parse line by line, storing recognized keys.
     * @return false if the file does not exist (defaults are kept), true once loaded.
     * @throw std::runtime_error if a line is malformed or a value does not parse.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("ConfigParser: File not found: " + filepath + ", using defaults");
            return false;
        }

        logger::info("ConfigParser: Loading config from " + filepath);
        std::stringstream buffer;
        buffer << inFile.rdbuf();
        parse(buffer.str());
        logger::info("ConfigParser: Config loaded.");
        return true;
    }

    /**
     * @brief Parse config text directly (used by loadFromFile and by tests).
     */
    inline void loadFromString(const std::string &content)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        parse(content);
    }

private:
    config::RedactorConfig &config_;
    std::mutex mutex_;

    inline void parse(const std::string &content)
    {
        std::istringstream in(content);
        std::string line;
        std::size_t lineNumber = 0;
        while (std::getline(in, line)) {
            ++lineNumber;
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNumber)
                                         + " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "excludedKinds") {
            config_.excludedKinds = parseKindList(val);
            logger::debug("ConfigParser: excludedKinds set to " + std::to_string(config_.excludedKinds.size())
                          + " kind(s)");
        }
        else if (key == "linePlaceholder") {
            if (val.empty()) {
                throw std::runtime_error("ConfigParser: linePlaceholder must not be empty");
            }
            config_.linePlaceholder = val;
            logger::debug("ConfigParser: linePlaceholder set to " + val);
        }
        else if (key == "maskCharacters") {
            if (val.empty()) {
                throw std::runtime_error("ConfigParser: maskCharacters must not be empty");
            }
            config_.maskCharacters = val;
            logger::debug("ConfigParser: maskCharacters set to " + val);
        }
        else if (key == "overlapPolicy") {
            config_.overlapPolicy = parseOverlapPolicy(val);
            logger::debug("ConfigParser: overlapPolicy set to " + val);
        }
        else if (key == "boundsPolicy") {
            config_.boundsPolicy = parseBoundsPolicy(val);
            logger::debug("ConfigParser: boundsPolicy set to " + val);
        }
        else if (key == "offsetUnit") {
            config_.offsetUnit = parseOffsetUnit(val);
            logger::debug("ConfigParser: offsetUnit set to " + val);
        }
        else if (key == "logLevel") {
            config_.logLevel = logger::parseLogLevel(val);
            logger::debug("ConfigParser: logLevel set to " + val);
        }
        else if (key == "logFile") {
            config_.logFile = val;
            logger::debug("ConfigParser: logFile set to " + val);
        }
        else if (key == "archivePath") {
            config_.archivePath = val;
            logger::debug("ConfigParser: archivePath set to " + val);
        }
        else if (key == "workerThreads") {
            config_.workerThreads = static_cast<std::size_t>(parseUInt(val));
            logger::debug("ConfigParser: workerThreads set to " + std::to_string(config_.workerThreads));
        }
        else {
            logger::warn("ConfigParser: Unrecognized key '" + key + "' with value '" + val + "'");
        }
    }
};

} // namespace util
} // namespace piiredact

#endif // PIIREDACT_UTIL_CONFIG_PARSER_HPP
