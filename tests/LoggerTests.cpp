#include <gtest/gtest.h>

#include <iostream>
#include <sstream>
#include <string>

#include "../src/utils/Logger.hpp"

namespace {

// Redirects std::cerr for the lifetime of the object.
class CerrCapture {
public:
    CerrCapture() : old(std::cerr.rdbuf(buffer.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(old); }

    std::string str() const { return buffer.str(); }

private:
    std::ostringstream buffer;
    std::streambuf* old;
};

}  // namespace

TEST(LoggerTest, ParsesLevelNames) {
    LogLevel level = LogLevel::INFO;

    EXPECT_TRUE(Logger::parseLevel("debug", level));
    EXPECT_EQ(LogLevel::DEBUG, level);
    EXPECT_TRUE(Logger::parseLevel("warning", level));
    EXPECT_EQ(LogLevel::WARN, level);
    EXPECT_TRUE(Logger::parseLevel("notice", level));
    EXPECT_EQ(LogLevel::INFO, level);

    EXPECT_FALSE(Logger::parseLevel("loud", level));
    EXPECT_EQ(LogLevel::INFO, level);
}

TEST(LoggerTest, DropsMessagesBelowLevel) {
    LogLevel saved = Logger::level();
    Logger::setLevel(LogLevel::WARN);
    EXPECT_EQ(LogLevel::WARN, Logger::level());

    std::string output;
    {
        CerrCapture capture;
        Logger::debug("hidden debug");
        Logger::info("hidden info");
        Logger::warn("visible warn");
        Logger::error("visible error");
        output = capture.str();
    }
    Logger::setLevel(saved);

    EXPECT_EQ(std::string::npos, output.find("hidden"));
    EXPECT_NE(std::string::npos, output.find("[WARN] visible warn"));
    EXPECT_NE(std::string::npos, output.find("[ERROR] visible error"));
}
