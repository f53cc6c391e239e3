#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "utils/ConsoleLogger.hpp"

TEST(ConsoleLoggerTest, WritesLevelAndMessage) {
    std::ostringstream out;
    std::ostringstream err;
    ConsoleLogger logger(out, err);

    logger.info("hello");
    logger.warn("careful");

    EXPECT_NE(out.str().find("[INFO] hello"), std::string::npos);
    EXPECT_NE(out.str().find("[WARN] careful"), std::string::npos);
    EXPECT_TRUE(err.str().empty());
}

TEST(ConsoleLoggerTest, ErrorsGoToErrorStream) {
    std::ostringstream out;
    std::ostringstream err;
    ConsoleLogger logger(out, err);

    logger.error("broken");

    EXPECT_TRUE(out.str().empty());
    EXPECT_NE(err.str().find("[ERROR] broken"), std::string::npos);
}

TEST(ConsoleLoggerTest, DropsMessagesBelowLevel) {
    std::ostringstream out;
    std::ostringstream err;
    ConsoleLogger logger(out, err, LogLevel::WARNING);

    logger.debug("noise");
    logger.info("chatter");
    EXPECT_TRUE(out.str().empty());

    logger.setLogLevel(LogLevel::DEBUG);
    EXPECT_EQ(logger.getLogLevel(), LogLevel::DEBUG);
    logger.debug("detail");
    EXPECT_NE(out.str().find("[DEBUG] detail"), std::string::npos);
}

TEST(ConsoleLoggerTest, ParseLogLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parseLogLevel("warning", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    EXPECT_TRUE(parseLogLevel("error", level));
    EXPECT_EQ(level, LogLevel::ERROR_LEVEL);

    EXPECT_FALSE(parseLogLevel("loud", level));
    EXPECT_EQ(level, LogLevel::ERROR_LEVEL);
}
