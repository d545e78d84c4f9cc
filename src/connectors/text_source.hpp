#ifndef PIIREDACT_CONNECTORS_TEXT_SOURCE_HPP
#define PIIREDACT_CONNECTORS_TEXT_SOURCE_HPP

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include "util/logger.hpp"

/**
 * @file text_source.hpp
 * @brief Where extracted document text comes from.
 *
 * OCR runs upstream; the engine only ever sees its text output. An empty
 * result (nothing recognised) is valid input, not an error.
 */

namespace piiredact {
namespace connectors {

/**
 * @class TextSource
 * @brief Produces the extracted text of one document.
 */
class TextSource
{
public:
    virtual ~TextSource() = default;

    /**
     * @throw std::runtime_error if the text cannot be obtained.
     */
    virtual std::string extractText() = 0;
};

/**
 * @brief Read a whole file as bytes.
 * @throw std::runtime_error if it cannot be opened or read.
 */
inline std::string readWholeFile(const std::string &path)
{
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("readWholeFile: cannot open " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("readWholeFile: read error on " + path);
    }
    return buffer.str();
}

/**
 * @class FileTextSource
 * @brief Text previously extracted to a file ("-" reads stdin).
 */
class FileTextSource : public TextSource
{
public:
    explicit FileTextSource(const std::string &path)
        : path_(path)
    {
    }

    std::string extractText() override
    {
        std::string text;
        if (path_ == "-") {
            std::ostringstream buffer;
            buffer << std::cin.rdbuf();
            text = buffer.str();
        } else {
            text = readWholeFile(path_);
        }
        if (text.empty()) {
            util::logger::info("FileTextSource: no text recognised in " + path_);
        } else {
            util::logger::debug("FileTextSource: read " + std::to_string(text.size()) + " bytes from " + path_);
        }
        return text;
    }

private:
    std::string path_;
};

} // namespace connectors
} // namespace piiredact

#endif // PIIREDACT_CONNECTORS_TEXT_SOURCE_HPP
