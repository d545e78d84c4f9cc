// test/unit/test_entity_redactor.cpp
// -----------------------------------------------------------
// Entity pass: exclusion, validation, overlap policy, offset units.

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "redaction/entity_redactor.hpp"
#include "redaction/errors.hpp"

using namespace piiredact::redaction;

namespace {

EntityRedactor redactorWith(OverlapPolicy overlap,
                            SpanBoundsPolicy bounds = SpanBoundsPolicy::Reject,
                            OffsetUnit unit = OffsetUnit::CodePoint) {
    EntityRedactorOptions options;
    options.overlap = overlap;
    options.bounds = bounds;
    options.unit = unit;
    return EntityRedactor(options);
}

} // namespace

TEST(EntityRedactorTest, NoSpansReturnsTextUnchanged) {
    const std::string text = "nothing to see\nhere";
    EXPECT_EQ(redactEntities(text, {}, {}), text);
}

TEST(EntityRedactorTest, SingleNameSpan) {
    EXPECT_EQ(redactEntities("Hello John Doe", {{"NAME", 6, 10}}, {}), "Hello [REDACTED NAME] Doe");
}

TEST(EntityRedactorTest, SpanStartingAtTheSpaceTakesTheSpace) {
    // [5,9) covers " Joh"
    EXPECT_EQ(redactEntities("Hello John Doe", {{"NAME", 5, 9}}, {}), "Hello[REDACTED NAME]n Doe");
}

TEST(EntityRedactorTest, InputOrderDoesNotMatter) {
    const std::string text = "AAA BBB CCC";
    EXPECT_EQ(redactEntities(text, {{"X", 0, 3}, {"Y", 8, 11}}, {}), "[REDACTED X] BBB [REDACTED Y]");
    EXPECT_EQ(redactEntities(text, {{"Y", 8, 11}, {"X", 0, 3}}, {}), "[REDACTED X] BBB [REDACTED Y]");
}

TEST(EntityRedactorTest, AdjacentSpansDoNotConflict) {
    EXPECT_EQ(redactEntities("abcdef", {{"B", 3, 6}, {"A", 0, 3}}, {}), "[REDACTED A][REDACTED B]");
}

TEST(EntityRedactorTest, ExcludedKindIsSameAsAbsentSpan) {
    const std::string text = "Host 10.0.0.1 seen by Jane";
    EntityList name = {{"NAME", 22, 26}};
    EntityList withIp = {{"IP_ADDRESS", 5, 13}, {"NAME", 22, 26}};
    KindSet excluded = {"IP_ADDRESS"};

    EXPECT_EQ(redactEntities(text, withIp, excluded), redactEntities(text, name, excluded));
    EXPECT_EQ(redactEntities(text, withIp, excluded), "Host 10.0.0.1 seen by [REDACTED NAME]");

    EntityRedaction r = EntityRedactor().redact(text, withIp, excluded);
    EXPECT_EQ(r.excluded, (size_t)1);
    EXPECT_EQ(r.redacted, (size_t)1);
}

TEST(EntityRedactorTest, AllSpansExcludedSkipsValidation) {
    // invalid UTF-8 and a bogus span, but everything is excluded
    const std::string text = "raw \xFF bytes";
    EXPECT_EQ(redactEntities(text, {{"IP_ADDRESS", 40, 2}}, {"IP_ADDRESS"}), text);
}

TEST(EntityRedactorTest, BeginAfterEndIsRejected) {
    const std::string text = "0123456789abcdef";
    std::string out = "untouched";
    try {
        out = redactEntities(text, {{"ID", 0, 2}, {"NAME", 10, 5}}, {});
        FAIL() << "expected InvalidSpanError";
    } catch (const InvalidSpanError& ex) {
        EXPECT_EQ(ex.kind(), "NAME");
        EXPECT_EQ(ex.begin(), (size_t)10);
        EXPECT_EQ(ex.end(), (size_t)5);
    }
    EXPECT_EQ(out, "untouched");
}

TEST(EntityRedactorTest, EndPastTextIsRejectedByDefault) {
    EXPECT_THROW(redactEntities("short", {{"NAME", 2, 6}}, {}), InvalidSpanError);
    EXPECT_THROW(redactEntities("short", {{"", 0, 1}}, {}), InvalidSpanError);
}

TEST(EntityRedactorTest, ErrorsShareOneBaseClass) {
    EXPECT_THROW(redactEntities("short", {{"NAME", 4, 1}}, {}), RedactionError);
    EXPECT_THROW(redactEntities("short", {{"A", 0, 3}, {"B", 2, 4}}, {}), RedactionError);
}

TEST(EntityRedactorTest, ClampPolicyTrimsToTextEnd) {
    EntityRedactor clamp = redactorWith(OverlapPolicy::Reject, SpanBoundsPolicy::Clamp);
    EXPECT_EQ(clamp.redact("call Jane", {{"NAME", 5, 40}}, {}).text, "call [REDACTED NAME]");
    EXPECT_EQ(clamp.redact("call Jane", {{"NAME", 5, 40}}, {}).outOfRange, (size_t)0);
    // a span with nothing left inside the text is dropped, not turned into an insertion
    EntityRedaction past = clamp.redact("call", {{"NAME", 9, 12}}, {});
    EXPECT_EQ(past.text, "call");
    EXPECT_EQ(past.redacted, (size_t)0);
    EXPECT_EQ(past.outOfRange, (size_t)1);
    past = clamp.redact("call", {{"NAME", 4, 6}, {"ID", 0, 2}}, {});
    EXPECT_EQ(past.text, "[REDACTED ID]ll");
    EXPECT_EQ(past.outOfRange, (size_t)1);
    // an empty span exactly at the end is still in range
    EXPECT_EQ(clamp.redact("call", {{"NAME", 4, 4}}, {}).text, "call[REDACTED NAME]");
    // begin > end stays an error under clamp
    EXPECT_THROW(clamp.redact("call", {{"NAME", 3, 1}}, {}), InvalidSpanError);
}

TEST(EntityRedactorTest, OverlapIsRejectedByDefault) {
    const std::string text = "0123456789abcdefghijklmnop";
    try {
        redactEntities(text, {{"A", 5, 15}, {"B", 10, 20}}, {});
        FAIL() << "expected OverlapConflictError";
    } catch (const OverlapConflictError& ex) {
        const std::string what = ex.what();
        EXPECT_NE(what.find("A[5,15)"), std::string::npos);
        EXPECT_NE(what.find("B[10,20)"), std::string::npos);
    }
    EXPECT_THROW(redactEntities(text, {{"OUTER", 2, 20}, {"INNER", 5, 8}}, {}), OverlapConflictError);
    EXPECT_THROW(redactEntities(text, {{"A", 3, 6}, {"A", 3, 6}}, {}), OverlapConflictError);
}

TEST(EntityRedactorTest, MergePolicyJoinsOverlaps) {
    EntityRedactor merge = redactorWith(OverlapPolicy::Merge);
    const std::string text = "0123456789abcdefghijklmnop";
    EntityRedaction r = merge.redact(text, {{"B", 10, 20}, {"A", 5, 15}, {"C", 22, 24}}, {});
    EXPECT_EQ(r.text, "01234[REDACTED A|B]kl[REDACTED C]op");
    EXPECT_EQ(r.redacted, (size_t)2);
    EXPECT_EQ(r.merged, (size_t)1);
}

TEST(EntityRedactorTest, MergeCollapsesDuplicatesAndNested) {
    EntityRedactor merge = redactorWith(OverlapPolicy::Merge);
    EXPECT_EQ(merge.redact("John Smith", {{"NAME", 0, 10}, {"NAME", 0, 4}, {"NAME", 0, 10}}, {}).text,
              "[REDACTED NAME]");
}

TEST(EntityRedactorTest, MergeOverlappingHelper) {
    EntityList merged = mergeOverlapping({{"Y", 4, 9}, {"X", 0, 5}, {"Z", 12, 14}, {"P", 7, 7}, {"Q", 10, 10}});
    ASSERT_EQ(merged.size(), (size_t)3);
    EXPECT_EQ(merged[0], (EntitySpan{"X|Y", 0, 9}));
    EXPECT_EQ(merged[1], (EntitySpan{"Q", 10, 10}));
    EXPECT_EQ(merged[2], (EntitySpan{"Z", 12, 14}));
}

TEST(EntityRedactorTest, EmptySpanInsertsPlaceholder) {
    EXPECT_EQ(redactEntities("ab", {{"GAP", 1, 1}}, {}), "a[REDACTED GAP]b");
    EXPECT_EQ(redactEntities("ab", {{"GAP", 1, 1}, {"X", 1, 2}}, {}), "a[REDACTED GAP][REDACTED X]");
    EXPECT_THROW(redactEntities("abc", {{"GAP", 1, 1}, {"X", 0, 3}}, {}), OverlapConflictError);
}

TEST(EntityRedactorTest, CodePointOffsetsOverMultiByteText) {
    // "Zoë Ünal paid" : ë and Ü are two bytes each
    const std::string text = "Zo\xC3\xAB \xC3\x9Cnal paid";
    EXPECT_EQ(redactEntities(text, {{"NAME", 0, 8}}, {}), "[REDACTED NAME] paid");
    EXPECT_EQ(redactEntities(text, {{"NAME", 4, 8}}, {}), "Zo\xC3\xAB [REDACTED NAME] paid");
    EXPECT_THROW(redactEntities(text, {{"NAME", 4, 14}}, {}), InvalidSpanError);
}

TEST(EntityRedactorTest, ByteOffsetsMustLandOnBoundaries) {
    const std::string text = "Zo\xC3\xAB \xC3\x9Cnal paid";
    EntityRedactor bytes = redactorWith(OverlapPolicy::Reject, SpanBoundsPolicy::Reject, OffsetUnit::Byte);
    EXPECT_EQ(bytes.redact(text, {{"NAME", 5, 10}}, {}).text, "Zo\xC3\xAB [REDACTED NAME] paid");
    try {
        bytes.redact(text, {{"NAME", 3, 10}}, {});
        FAIL() << "expected EncodingBoundaryError";
    } catch (const EncodingBoundaryError& ex) {
        EXPECT_EQ(ex.byteOffset(), (size_t)3);
    }
    EXPECT_THROW(bytes.redact(text, {{"NAME", 5, 6}}, {}), EncodingBoundaryError);
}

TEST(EntityRedactorTest, InvalidUtf8WithSurvivingSpansIsRejected) {
    EXPECT_THROW(redactEntities("bad \xC3( text", {{"NAME", 0, 3}}, {}), EncodingBoundaryError);
}
