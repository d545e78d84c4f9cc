// test/unit/test_line_redactor.cpp
// -----------------------------------------------------------
// Structural pass: masked-number lines are replaced whole, everything else
// survives byte-for-byte.

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "redaction/line_redactor.hpp"

using piiredact::redaction::LineRedaction;
using piiredact::redaction::LineRedactor;
using piiredact::redaction::redactLines;

TEST(LineRedactorTest, EmptyTextStaysEmpty) {
    LineRedaction r = LineRedactor().redact("");
    EXPECT_EQ(r.text, "");
    EXPECT_EQ(r.linesRedacted, (size_t)0);
    EXPECT_TRUE(r.offsets.isIdentity());
}

TEST(LineRedactorTest, TextWithoutSignatureIsUnchanged) {
    const std::string text = "Patient: Jane Roe\nDOB 1970-01-01\n\nNotes: fine * 5 stars\n";
    EXPECT_EQ(redactLines(text), text);
}

TEST(LineRedactorTest, MaskedNumberLineIsReplacedWhole) {
    const std::string text = "Name: Jane\nCard ***1234 on file\nEnd";
    LineRedaction r = LineRedactor().redact(text);
    EXPECT_EQ(r.text, "Name: Jane\n[REDACTED LINE]\nEnd");
    EXPECT_EQ(r.linesRedacted, (size_t)1);
    ASSERT_EQ(r.offsets.edits().size(), (size_t)1);
    EXPECT_EQ(r.offsets.edits()[0].begin, (size_t)11);
    EXPECT_EQ(r.offsets.edits()[0].end, (size_t)31);
}

TEST(LineRedactorTest, OnlyTheQualifyingLineChanges) {
    const std::string text = "first\n***1234\nlast";
    EXPECT_EQ(redactLines(text), "first\n[REDACTED LINE]\nlast");
}

TEST(LineRedactorTest, SeveralRunsOnOneLineGiveOnePlaceholder) {
    EXPECT_EQ(redactLines("a ***12 b **9 c *0"), "[REDACTED LINE]");
}

TEST(LineRedactorTest, MaskWithoutDigitsDoesNotMatch) {
    const std::string text = "*****\n*** ***\n1234 ****";
    EXPECT_EQ(redactLines(text), text);
}

TEST(LineRedactorTest, RunSplitByLineBreakDoesNotMatch) {
    const std::string text = "account ***\n1234 follows";
    EXPECT_EQ(redactLines(text), text);
}

TEST(LineRedactorTest, CarriageReturnIsKeptWithSeparator) {
    const std::string text = "keep\r\n***99\r\nkeep too\r\n";
    EXPECT_EQ(redactLines(text), "keep\r\n[REDACTED LINE]\r\nkeep too\r\n");
}

TEST(LineRedactorTest, TrailingNewlineAndLastLine) {
    EXPECT_EQ(redactLines("***1\n"), "[REDACTED LINE]\n");
    EXPECT_EQ(redactLines("ok\n***1"), "ok\n[REDACTED LINE]");
}

TEST(LineRedactorTest, SecondRunIsNoOp) {
    const std::string text = "x\n***1234\ny **5\nz";
    const std::string once = redactLines(text);
    EXPECT_EQ(redactLines(once), once);
}

TEST(LineRedactorTest, NonAsciiLinesPassThrough) {
    const std::string text = "Grüße ***42\nnaïve café";
    EXPECT_EQ(redactLines(text), "[REDACTED LINE]\nnaïve café");
}

TEST(LineRedactorTest, CustomMaskCharacters) {
    LineRedactor redactor("<masked>", "xX#");
    EXPECT_EQ(redactor.redactLines("acct XXxx4321\nacct ***4321\nref ##7"),
              "<masked>\nacct ***4321\n<masked>");
}

TEST(LineRedactorTest, BracketCharactersAreEscapedInMaskSet) {
    LineRedactor redactor("[gone]", "]-^");
    EXPECT_EQ(redactor.redactLines("a ]]12\nb --3\nc ^4\nd 5"), "[gone]\n[gone]\n[gone]\nd 5");
}

TEST(LineRedactorTest, VeryLongMaskRunFollowedByDigits) {
    const std::string text = "head\n" + std::string(1000000, '*') + "1234\ntail";
    EXPECT_EQ(redactLines(text), "head\n[REDACTED LINE]\ntail");
}

TEST(LineRedactorTest, VeryLongMaskRunWithoutDigitsIsKept) {
    const std::string text = std::string(1000000, '*') + " end";
    EXPECT_EQ(redactLines(text), text);

    std::string alternating;
    for (int i = 0; i < 200000; ++i) {
        alternating += "** ";
    }
    EXPECT_EQ(redactLines(alternating + "\n**7"), alternating + "\n[REDACTED LINE]");
}

TEST(LineRedactorTest, RejectsUnusablePlaceholderOrMask) {
    EXPECT_THROW(LineRedactor("two\nlines"), std::invalid_argument);
    EXPECT_THROW(LineRedactor("card ***1"), std::invalid_argument);
    EXPECT_THROW(LineRedactor("[X]", ""), std::invalid_argument);
    EXPECT_THROW(LineRedactor("[X]", "*7"), std::invalid_argument);
    EXPECT_THROW(LineRedactor("[X]", "\n"), std::invalid_argument);
}
