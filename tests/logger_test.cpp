#include "gtest/gtest.h"
#include "logger.hpp"
#include <sstream>

TEST(LoggerTest, WritesTaggedLines) {
    std::ostringstream out;
    const Logger log{ &out, LogLevel::Debug };

    log.debug("d");
    log.info("i");
    log.warn("w");
    log.error("e");

    EXPECT_EQ(out.str(), "[DEBUG] d\n[INFO] i\n[WARN] w\n[ERROR] e\n");
}

TEST(LoggerTest, DropsMessagesBelowThreshold) {
    std::ostringstream out;
    Logger log{ &out, LogLevel::Warning };

    log.info("hidden");
    log.warn("shown");
    EXPECT_EQ(out.str(), "[WARN] shown\n");

    log.setThreshold(LogLevel::Error);
    log.warn("hidden too");
    EXPECT_EQ(out.str(), "[WARN] shown\n");
}

TEST(LoggerTest, SilentLoggerWritesNothing) {
    const Logger log = Logger::silent();
    EXPECT_FALSE(log.enabled(LogLevel::Error));
    log.error("nowhere");   // must not crash
}

TEST(LoggerTest, SinkCanBeSwapped) {
    std::ostringstream first, second;
    Logger log{ &first };
    log.info("a");
    log.setSink(&second);
    log.info("b");

    EXPECT_EQ(first.str(),  "[INFO] a\n");
    EXPECT_EQ(second.str(), "[INFO] b\n");
}

TEST(LoggerTest, EveryLevelHasItsOwnTag) {
    EXPECT_EQ(levelTag(LogLevel::Debug),   "[DEBUG] ");
    EXPECT_EQ(levelTag(LogLevel::Info),    "[INFO] ");
    EXPECT_EQ(levelTag(LogLevel::Warning), "[WARN] ");
    EXPECT_EQ(levelTag(LogLevel::Error),   "[ERROR] ");
    static_assert(levelTag(LogLevel::Error) == "[ERROR] ");
}

TEST(LoggerTest, WarningsLoggerTargetsClogAtWarningLevel) {
    const Logger log = Logger::warnings();
    EXPECT_EQ(log.threshold(), LogLevel::Warning);
    EXPECT_TRUE(log.enabled(LogLevel::Warning));
    EXPECT_FALSE(log.enabled(LogLevel::Info));
}
