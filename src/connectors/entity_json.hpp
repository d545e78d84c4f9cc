#ifndef PIIREDACT_CONNECTORS_ENTITY_JSON_HPP
#define PIIREDACT_CONNECTORS_ENTITY_JSON_HPP

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include "redaction/entity_span.hpp"
#include "redaction/errors.hpp"

/**
 * @file entity_json.hpp
 * @brief Reads the entity list an external detector produced.
 *
 * DESIGN GOALS:
 *   - Accept the shape of an AWS Comprehend DetectPiiEntities response:
 *       {"Entities":[{"Score":0.99,"Type":"NAME","BeginOffset":6,"EndOffset":10}, ...]}
 *     or a bare array of entity objects.
 *   - Accept short keys too: {"kind":"NAME","begin":6,"end":10}.
 *   - Skip anything else (Score, response metadata, nested objects).
 *   - Header-only, no external JSON library, a small scanner over the input.
 *
 * Errors:
 *   - malformed JSON, a missing key, or a non-integer offset -> std::runtime_error
 *   - a negative offset -> redaction::InvalidSpanError
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiredact;
 *   redaction::EntityList spans = connectors::parseEntityJson(responseBody);
 *   @endcode
 */

namespace piiredact {
namespace connectors {

class EntityJsonReader
{
public:
    explicit EntityJsonReader(const std::string &json)
        : json_(json), pos_(0)
    {
    }

    /**
     * @brief Parse the whole document.
     */
    redaction::EntityList read()
    {
        redaction::EntityList spans;
        skipWhitespace();
        if (peek() == '[') {
            spans = readEntityArray();
        } else if (peek() == '{') {
            bool found = false;
            ++pos_;
            skipWhitespace();
            if (peek() == '}') {
                ++pos_;
            } else {
                while (true) {
                    std::string key = readString();
                    expect(':');
                    if (key == "Entities" || key == "entities") {
                        spans = readEntityArray();
                        found = true;
                    } else {
                        skipValue();
                    }
                    if (!nextMember('}')) {
                        break;
                    }
                }
            }
            if (!found) {
                throw std::runtime_error("parseEntityJson: object has no \"Entities\" array");
            }
        } else {
            fail("expected '[' or '{'");
        }
        skipWhitespace();
        if (pos_ != json_.size()) {
            fail("trailing characters after JSON value");
        }
        return spans;
    }

private:
    redaction::EntityList readEntityArray()
    {
        redaction::EntityList spans;
        expect('[');
        skipWhitespace();
        if (peek() == ']') {
            ++pos_;
            return spans;
        }
        while (true) {
            spans.push_back(readEntity(spans.size()));
            if (!nextMember(']')) {
                break;
            }
        }
        return spans;
    }

    redaction::EntitySpan readEntity(std::size_t index)
    {
        std::optional<std::string> kind;
        std::optional<std::string> begin;
        std::optional<std::string> end;

        expect('{');
        skipWhitespace();
        if (peek() == '}') {
            ++pos_;
        } else {
            while (true) {
                std::string key = readString();
                expect(':');
                if (key == "Type" || key == "kind") {
                    kind = readString();
                } else if (key == "BeginOffset" || key == "begin") {
                    begin = readNumber();
                } else if (key == "EndOffset" || key == "end") {
                    end = readNumber();
                } else {
                    skipValue();
                }
                if (!nextMember('}')) {
                    break;
                }
            }
        }

        if (!kind || !begin || !end) {
            throw std::runtime_error("parseEntityJson: entity #" + std::to_string(index)
                                     + " needs Type, BeginOffset and EndOffset");
        }
        redaction::EntitySpan span;
        span.kind = *kind;
        span.begin = toOffset(*begin, span.kind, index);
        span.end = toOffset(*end, span.kind, index);
        return span;
    }

    static std::size_t toOffset(const std::string &number, const std::string &kind, std::size_t index)
    {
        const std::string where = "parseEntityJson: entity #" + std::to_string(index);
        if (!number.empty() && number[0] == '-') {
            throw redaction::InvalidSpanError("negative offset " + number + " in entity #"
                                              + std::to_string(index), kind, 0, 0);
        }
        if (number.find_first_of(".eE") != std::string::npos) {
            throw std::runtime_error(where + ": offset " + number + " is not an integer");
        }
        try {
            return static_cast<std::size_t>(std::stoull(number));
        } catch (const std::out_of_range &) {
            throw std::runtime_error(where + ": offset " + number + " is out of range");
        }
    }

    // After a member: true on ',' (another follows), false on the closing character.
    bool nextMember(char closing)
    {
        skipWhitespace();
        if (peek() == ',') {
            ++pos_;
            skipWhitespace();
            return true;
        }
        if (peek() == closing) {
            ++pos_;
            return false;
        }
        fail(std::string("expected ',' or '") + closing + "'");
        return false;
    }

    std::string readString()
    {
        skipWhitespace();
        if (peek() != '"') {
            fail("expected string");
        }
        ++pos_;
        std::string out;
        while (true) {
            if (pos_ >= json_.size()) {
                fail("unterminated string");
            }
            char c = json_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("control character in string");
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= json_.size()) {
                fail("unterminated escape");
            }
            char esc = json_[pos_++];
            switch (esc) {
            case '"':  out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/':  out.push_back('/'); break;
            case 'b':  out.push_back('\b'); break;
            case 'f':  out.push_back('\f'); break;
            case 'n':  out.push_back('\n'); break;
            case 'r':  out.push_back('\r'); break;
            case 't':  out.push_back('\t'); break;
            case 'u':  appendUtf8(out, readEscapedCodePoint()); break;
            default:
                fail(std::string("invalid escape '\\") + esc + "'");
            }
        }
    }

    uint32_t readEscapedCodePoint()
    {
        uint32_t cp = readHex4();
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (json_.compare(pos_, 2, "\\u") != 0) {
                fail("unpaired surrogate");
            }
            pos_ += 2;
            uint32_t low = readHex4();
            if (low < 0xDC00 || low > 0xDFFF) {
                fail("invalid low surrogate");
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("unpaired surrogate");
        }
        return cp;
    }

    uint32_t readHex4()
    {
        if (pos_ + 4 > json_.size()) {
            fail("truncated \\u escape");
        }
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char h = json_[pos_++];
            value <<= 4;
            if (h >= '0' && h <= '9') value |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') value |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') value |= static_cast<uint32_t>(h - 'A' + 10);
            else fail("invalid hex digit in \\u escape");
        }
        return value;
    }

    static void appendUtf8(std::string &out, uint32_t cp)
    {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    // Raw JSON number text, validated for shape only.
    std::string readNumber()
    {
        skipWhitespace();
        std::size_t start = pos_;
        if (peek() == '-') {
            ++pos_;
        }
        std::size_t digitsStart = pos_;
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            ++pos_;
        }
        if (pos_ == digitsStart) {
            fail("expected number");
        }
        if (peek() == '.') {
            ++pos_;
            while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
        }
        if (peek() == 'e' || peek() == 'E') {
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
        }
        return json_.substr(start, pos_ - start);
    }

    void skipValue()
    {
        skipWhitespace();
        char c = peek();
        if (c == '"') {
            readString();
        } else if (c == '{' || c == '[') {
            const char closing = (c == '{') ? '}' : ']';
            ++pos_;
            skipWhitespace();
            if (peek() == closing) {
                ++pos_;
                return;
            }
            while (true) {
                if (closing == '}') {
                    readString();
                    expect(':');
                }
                skipValue();
                if (!nextMember(closing)) {
                    break;
                }
            }
        } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            readNumber();
        } else if (json_.compare(pos_, 4, "true") == 0 || json_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
        } else if (json_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
        } else {
            fail("unexpected character");
        }
    }

    void expect(char c)
    {
        skipWhitespace();
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    void skipWhitespace()
    {
        while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            ++pos_;
        }
    }

    char peek() const
    {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    [[noreturn]] void fail(const std::string &what) const
    {
        throw std::runtime_error("parseEntityJson: " + what + " at offset " + std::to_string(pos_));
    }

    const std::string &json_;
    std::size_t pos_;
};

/**
 * @brief Parse detector output (see file comment for accepted shapes).
 */
inline redaction::EntityList parseEntityJson(const std::string &json)
{
    return EntityJsonReader(json).read();
}

} // namespace connectors
} // namespace piiredact

#endif // PIIREDACT_CONNECTORS_ENTITY_JSON_HPP
