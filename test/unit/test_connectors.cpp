// test/unit/test_connectors.cpp
// -----------------------------------------------------------
// Detector output parsing, file text source, and the JSON response envelope.

#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "connectors/entity_detector.hpp"
#include "connectors/entity_json.hpp"
#include "connectors/text_source.hpp"
#include "redaction/errors.hpp"
#include "service/response.hpp"

using piiredact::connectors::parseEntityJson;
using piiredact::redaction::EntityList;
using piiredact::redaction::EntitySpan;

namespace {

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

} // namespace

TEST(EntityJsonTest, ReadsDetectorResponseShape) {
    const std::string json = R"({
        "Entities": [
            {"Score": 0.9991, "Type": "NAME", "BeginOffset": 6, "EndOffset": 10},
            {"Score": 0.97, "Type": "IP_ADDRESS", "BeginOffset": 20, "EndOffset": 31}
        ],
        "ResponseMetadata": {"RequestId": "abc", "RetryAttempts": 0, "Tags": [1, true, null]}
    })";
    EntityList spans = parseEntityJson(json);
    ASSERT_EQ(spans.size(), (size_t)2);
    EXPECT_EQ(spans[0], (EntitySpan{"NAME", 6, 10}));
    EXPECT_EQ(spans[1], (EntitySpan{"IP_ADDRESS", 20, 31}));
}

TEST(EntityJsonTest, ReadsBareArrayWithShortKeys) {
    EntityList spans = parseEntityJson(R"([{"kind":"DATE","begin":0,"end":10},{"end":3,"begin":1,"kind":"X"}])");
    ASSERT_EQ(spans.size(), (size_t)2);
    EXPECT_EQ(spans[1], (EntitySpan{"X", 1, 3}));
    EXPECT_TRUE(parseEntityJson("[]").empty());
    EXPECT_TRUE(parseEntityJson(R"({"Entities": []})").empty());
}

TEST(EntityJsonTest, DecodesEscapedKinds) {
    EntityList spans = parseEntityJson(R"([{"kind":"A\"Bé😀","begin":0,"end":1}])");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].kind, "A\"B\xC3\xA9\xF0\x9F\x98\x80");

    spans = parseEntityJson(R"([{"kind":"\u00e9\ud83d\ude00","begin":0,"end":1}])");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].kind, "\xC3\xA9\xF0\x9F\x98\x80");
    EXPECT_THROW(parseEntityJson(R"([{"kind":"\ud83d","begin":0,"end":1}])"), std::runtime_error);
}

TEST(EntityJsonTest, RejectsBadInput) {
    EXPECT_THROW(parseEntityJson(""), std::runtime_error);
    EXPECT_THROW(parseEntityJson(R"({"Other": 1})"), std::runtime_error);
    EXPECT_THROW(parseEntityJson(R"([{"Type":"NAME","BeginOffset":1}])"), std::runtime_error);
    EXPECT_THROW(parseEntityJson(R"([{"Type":"NAME","BeginOffset":1.5,"EndOffset":3}])"), std::runtime_error);
    EXPECT_THROW(parseEntityJson(R"([{"Type":"NAME","BeginOffset":1,"EndOffset":3}] x)"), std::runtime_error);
    EXPECT_THROW(parseEntityJson(R"([{"Type":"NAME","BeginOffset":1,"EndOffset":3})"), std::runtime_error);
    EXPECT_THROW(parseEntityJson(R"([{"Type":"NAME","BeginOffset":1,"EndOffset":99999999999999999999999}])"),
                 std::runtime_error);
}

TEST(EntityJsonTest, NegativeOffsetIsAnInvalidSpan) {
    EXPECT_THROW(parseEntityJson(R"([{"Type":"NAME","BeginOffset":-2,"EndOffset":3}])"),
                 piiredact::redaction::InvalidSpanError);
}

TEST(TextSourceTest, ReadsFileAndAcceptsEmptyText) {
    const std::string path = "test_text_source.txt";
    writeFile(path, "line one\n***1\n");
    piiredact::connectors::FileTextSource source(path);
    EXPECT_EQ(source.extractText(), "line one\n***1\n");

    writeFile(path, "");
    piiredact::connectors::FileTextSource empty(path);
    EXPECT_EQ(empty.extractText(), "");
    std::remove(path.c_str());

    piiredact::connectors::FileTextSource missing("does_not_exist_piiredact.txt");
    EXPECT_THROW(missing.extractText(), std::runtime_error);
}

TEST(EntityDetectorTest, JsonFileDetectorReplaysSavedResponse) {
    const std::string path = "test_entities.json";
    writeFile(path, R"({"Entities":[{"Type":"NAME","BeginOffset":0,"EndOffset":4}]})");
    piiredact::connectors::JsonEntityFileDetector detector(path);
    EntityList spans = detector.detect("Jane went home");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].kind, "NAME");
    std::remove(path.c_str());

    piiredact::connectors::NoEntityDetector none;
    EXPECT_TRUE(none.detect("Jane went home").empty());
}

TEST(ResponseTest, JsonEnvelopeCarriesTextAndCounts) {
    piiredact::redaction::RedactionResult result;
    result.text = "[REDACTED LINE]\n\"quoted\"\ttab caf\xC3\xA9";
    result.linesRedacted = 1;
    result.entitiesRedacted = 2;
    result.entitiesExcluded = 3;

    piiredact::service::RedactionResponse response(result);
    EXPECT_EQ(response.toJson(),
              "{\"redacted_text\":\"[REDACTED LINE]\\n\\\"quoted\\\"\\ttab caf\xC3\xA9\","
              "\"stats\":{\"lines_redacted\":1,\"entities_redacted\":2,\"entities_excluded\":3,"
              "\"entities_merged\":0,\"entities_absorbed\":0,\"entities_out_of_range\":0}}");
}

TEST(ResponseTest, ControlCharactersAreEscaped) {
    EXPECT_EQ(piiredact::service::RedactionResponse::escapeString(std::string("a\x01" "b\\", 4)), "a\\u0001b\\\\");
}
