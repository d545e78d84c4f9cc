#ifndef PIIREDACT_SERVICE_RESPONSE_HPP
#define PIIREDACT_SERVICE_RESPONSE_HPP

#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include "redaction/redactor.hpp"

/**
 * @file response.hpp
 * @brief JSON envelope for a redacted document, used by `piiredact --json`.
 *
 * Shape:
 *   {"redacted_text":"...","stats":{"lines_redacted":1,"entities_redacted":2,
 *    "entities_excluded":0,"entities_merged":0,"entities_absorbed":0,
 *    "entities_out_of_range":0}}
 *
 * Only the redacted text and counts go in; there is no field that could carry
 * original text.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiredact::service;
 *   RedactionResponse resp(redactor.redact(text, spans));
 *   std::cout << resp.toJson() << "\n";
 *   @endcode
 */

namespace piiredact {
namespace service {

struct RedactionResponse
{
    explicit RedactionResponse(redaction::RedactionResult result)
        : result_(std::move(result))
    {
    }

    inline std::string toJson() const
    {
        std::ostringstream oss;
        oss << R"({"redacted_text":")" << escapeString(result_.text) << R"(",)";
        oss << R"("stats":{)";
        oss << R"("lines_redacted":)" << result_.linesRedacted << ",";
        oss << R"("entities_redacted":)" << result_.entitiesRedacted << ",";
        oss << R"("entities_excluded":)" << result_.entitiesExcluded << ",";
        oss << R"("entities_merged":)" << result_.entitiesMerged << ",";
        oss << R"("entities_absorbed":)" << result_.entitiesAbsorbed << ",";
        oss << R"("entities_out_of_range":)" << result_.entitiesOutOfRange;
        oss << "}}";
        return oss.str();
    }

    /**
     * @brief Escape a UTF-8 string for a JSON string literal. Non-ASCII bytes pass through.
     */
    inline static std::string escapeString(const std::string &in)
    {
        std::ostringstream oss;
        for (char c : in) {
            switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b";  break;
            case '\f': oss << "\\f";  break;
            case '\n': oss << "\\n";  break;
            case '\r': oss << "\\r";  break;
            case '\t': oss << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    oss << c;
                }
                break;
            }
        }
        return oss.str();
    }

private:
    redaction::RedactionResult result_;
};

} // namespace service
} // namespace piiredact

#endif // PIIREDACT_SERVICE_RESPONSE_HPP
