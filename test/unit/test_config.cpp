// test/unit/test_config.cpp
// -----------------------------------------------------------
// RedactorConfig defaults, ConfigParser, logger level parsing and hashing.

#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "config/redactor_config.hpp"
#include "util/config_parser.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

using piiredact::config::RedactorConfig;
using piiredact::redaction::OffsetUnit;
using piiredact::redaction::OverlapPolicy;
using piiredact::redaction::SpanBoundsPolicy;
using piiredact::util::ConfigParser;

TEST(RedactorConfigTest, Defaults) {
    RedactorConfig cfg;
    EXPECT_EQ(cfg.excludedKinds.size(), (size_t)1);
    EXPECT_EQ(cfg.excludedKinds.count("IP_ADDRESS"), (size_t)1);
    EXPECT_EQ(cfg.linePlaceholder, "[REDACTED LINE]");
    EXPECT_EQ(cfg.maskCharacters, "*");
    EXPECT_EQ(cfg.overlapPolicy, OverlapPolicy::Reject);
    EXPECT_EQ(cfg.boundsPolicy, SpanBoundsPolicy::Reject);
    EXPECT_EQ(cfg.offsetUnit, OffsetUnit::CodePoint);
    EXPECT_TRUE(cfg.archivePath.empty());
    EXPECT_EQ(cfg.workerThreads, (size_t)0);
}

TEST(ConfigParserTest, ParsesAllKeys) {
    RedactorConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromString(
        "# deployment settings\n"
        "excludedKinds = IP_ADDRESS, URL ,,AGE\n"
        "linePlaceholder=<line removed>\n"
        "maskCharacters = *xX\n"
        "overlapPolicy = Merge\n"
        "boundsPolicy = clamp\n"
        "offsetUnit = byte\n"
        "logLevel = warn\n"
        "logFile = piiredact.log\n"
        "archivePath = redactions.db\n"
        "workerThreads = 6\n"
        "\n"
        "someFutureKey = 1\n");

    EXPECT_EQ(cfg.excludedKinds.size(), (size_t)3);
    EXPECT_EQ(cfg.excludedKinds.count("URL"), (size_t)1);
    EXPECT_EQ(cfg.excludedKinds.count("AGE"), (size_t)1);
    EXPECT_EQ(cfg.linePlaceholder, "<line removed>");
    EXPECT_EQ(cfg.maskCharacters, "*xX");
    EXPECT_EQ(cfg.overlapPolicy, OverlapPolicy::Merge);
    EXPECT_EQ(cfg.boundsPolicy, SpanBoundsPolicy::Clamp);
    EXPECT_EQ(cfg.offsetUnit, OffsetUnit::Byte);
    EXPECT_EQ(cfg.logLevel, piiredact::util::logger::LogLevel::WARN);
    EXPECT_EQ(cfg.logFile, "piiredact.log");
    EXPECT_EQ(cfg.archivePath, "redactions.db");
    EXPECT_EQ(cfg.workerThreads, (size_t)6);
}

TEST(ConfigParserTest, EmptyExclusionListRedactsEverything) {
    RedactorConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromString("excludedKinds =\n");
    EXPECT_TRUE(cfg.excludedKinds.empty());
}

TEST(ConfigParserTest, RejectsBadValues) {
    RedactorConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_THROW(parser.loadFromString("overlapPolicy = clamp\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("boundsPolicy = maybe\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("offsetUnit = word\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("workerThreads = -2\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("workerThreads = 4x\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("logLevel = loud\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("linePlaceholder =\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("just some words\n"), std::runtime_error);
}

TEST(ConfigParserTest, MissingFileKeepsDefaults) {
    RedactorConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_FALSE(parser.loadFromFile("no_such_piiredact.conf"));
    EXPECT_EQ(cfg.excludedKinds.count("IP_ADDRESS"), (size_t)1);
}

TEST(ConfigParserTest, LoadsFromFile) {
    const std::string path = "test_piiredact.conf";
    {
        std::ofstream out(path);
        out << "overlapPolicy=merge\nexcludedKinds=EMAIL\n";
    }
    RedactorConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_TRUE(parser.loadFromFile(path));
    EXPECT_EQ(cfg.overlapPolicy, OverlapPolicy::Merge);
    EXPECT_EQ(cfg.excludedKinds.count("EMAIL"), (size_t)1);
    EXPECT_EQ(cfg.excludedKinds.count("IP_ADDRESS"), (size_t)0);
    std::remove(path.c_str());
}

TEST(LoggerTest, ParsesLevelNames) {
    using piiredact::util::logger::LogLevel;
    using piiredact::util::logger::parseLogLevel;
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("Critical"), LogLevel::CRITICAL);
    EXPECT_THROW(parseLogLevel("verbose"), std::runtime_error);
}

TEST(HashingTest, Sha256KnownVectors) {
    using piiredact::util::hashing::sha256;
    using piiredact::util::hashing::shortDigest;
    EXPECT_EQ(sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(shortDigest(sha256("abc")), "ba7816bf8f01");
}
