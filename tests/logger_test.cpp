#include "logger.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using namespace tsid;

namespace {

std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST(LoggerTest, ParseLevel) {
    LogLevel lvl = LogLevel::INFO;
    EXPECT_TRUE(parse_level("debug", lvl));
    EXPECT_EQ(lvl, LogLevel::DEBUG);
    EXPECT_TRUE(parse_level("warning", lvl));
    EXPECT_EQ(lvl, LogLevel::WARN);
    EXPECT_TRUE(parse_level("error", lvl));
    EXPECT_EQ(lvl, LogLevel::ERROR);
    EXPECT_FALSE(parse_level("verbose", lvl));
    EXPECT_EQ(lvl, LogLevel::ERROR);
}

TEST(LoggerTest, UnopenedLoggerIsDisabled) {
    Logger logger;
    EXPECT_FALSE(logger.is_open());
    EXPECT_FALSE(logger.enabled(LogLevel::ERROR));
    logger.error("dropped");
}

TEST(LoggerTest, FiltersBelowLevel) {
    std::string path = ::testing::TempDir() + "tsid_logger_test.log";
    std::remove(path.c_str());
    {
        Logger logger(path, LogLevel::WARN);
        ASSERT_TRUE(logger.is_open());
        EXPECT_FALSE(logger.enabled(LogLevel::INFO));
        EXPECT_TRUE(logger.enabled(LogLevel::WARN));
        logger.info("quiet");
        logger.warn("loud");
        logger.set_level(LogLevel::DEBUG);
        EXPECT_TRUE(logger.enabled(LogLevel::DEBUG));
        logger.debug("now visible");
    }
    std::string text = slurp(path);
    EXPECT_EQ(text.find("quiet"), std::string::npos);
    EXPECT_NE(text.find("[WARN] loud\n"), std::string::npos) << text;
    EXPECT_NE(text.find("[DEBUG] now visible\n"), std::string::npos) << text;
    // "YYYY-MM-DDTHH:MM:SS.mmmZ [LEVEL] ..."
    ASSERT_GT(text.size(), 25u);
    EXPECT_EQ(text[10], 'T');
    EXPECT_EQ(text[23], 'Z');
    EXPECT_EQ(text[24], ' ');
}
