//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_logger.cpp
// Purpose: GoogleTests for Logger placeholder formatting, level parsing and environment configuration
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include "logging/Logger.h"

TEST(Logger, SetLogFileAppendsMessages) {
    const std::string path = ::testing::TempDir() + "credo_logger_test.log";
    std::remove(path.c_str());
    Logger::setLogFile(path);
    Logger::logf("WARN", "state {} rejected", "file.cpp", 12, "abc");

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("=== credo log opened at"), std::string::npos);
    EXPECT_NE(content.str().find("file.cpp:12: state abc rejected"), std::string::npos);
}

TEST(Logger, FormatSubstitutesPlaceholdersInOrder) {
    EXPECT_EQ(Logger::format("{} + {} = {}", 1, 2, "three"), std::string("1 + 2 = three"));
    EXPECT_EQ(Logger::format("no args"), std::string("no args"));
}

TEST(Logger, FormatKeepsEscapedBracesAndSurplusPlaceholders) {
    EXPECT_EQ(Logger::format("{{literal}} {}", 7), std::string("{literal} 7"));
    EXPECT_EQ(Logger::format("{} and {}", "one"), std::string("one and {}"));
}

TEST(Logger, LevelFromStringIsCaseInsensitive) {
    EXPECT_EQ(Logger::levelFromString("warning"), Logger::Level::WARN);
    EXPECT_EQ(Logger::levelFromString("Error"), Logger::Level::ERROR);
    EXPECT_EQ(Logger::levelFromString("info"), Logger::Level::INFO);
    EXPECT_EQ(Logger::levelFromString("bogus"), Logger::Level::DEBUG);
    EXPECT_EQ(Logger::toLogLevel(Logger::Level::FATAL), LogLevel::LOG_FATAL_LEVEL);
}

TEST(Logger, ConfigureFromEnvironmentAppliesLevel) {
    const LogLevel saved = Logger::sLogLevel;
    ::setenv("CREDO_LOG_LEVEL", "error", 1);
    Logger::configureFromEnvironment();
    EXPECT_EQ(Logger::sLogLevel, LogLevel::LOG_ERROR_LEVEL);

    ::unsetenv("CREDO_LOG_LEVEL");
    Logger::setLogLevel(LogLevel::LOG_WARN_LEVEL);
    Logger::configureFromEnvironment();
    EXPECT_EQ(Logger::sLogLevel, LogLevel::LOG_WARN_LEVEL);
    Logger::setLogLevel(saved);
}

TEST(EnvVars, UnsignedParsingFallsBackOnGarbage) {
    ::setenv("CREDO_TEST_UNSIGNED", "42", 1);
    EXPECT_EQ(GetEnvUnsignedOrDefault("CREDO_TEST_UNSIGNED", 7), 42ul);
    ::setenv("CREDO_TEST_UNSIGNED", "abc", 1);
    EXPECT_EQ(GetEnvUnsignedOrDefault("CREDO_TEST_UNSIGNED", 7), 7ul);
    ::unsetenv("CREDO_TEST_UNSIGNED");
    EXPECT_EQ(GetEnvUnsignedOrDefault("CREDO_TEST_UNSIGNED", 9), 9ul);
    EXPECT_EQ(GetEnvOrDefault("", "dflt"), std::string("dflt"));
}
