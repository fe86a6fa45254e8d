#include "Logger.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace SkipKP;

namespace {

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

} // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() / "skip_kp_logger_test.log").string();
        std::filesystem::remove(path_);
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.setLogFile("");
        logger.setConsoleOutput(true);
        logger.setLevel(LogLevel::WARN);
        std::filesystem::remove(path_);
    }

    std::string path_;
};

TEST_F(LoggerTest, Singleton) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggerTest, WritesLevelAndComponent) {
    auto& logger = Logger::instance();
    ASSERT_TRUE(logger.setLogFile(path_));
    logger.setConsoleOutput(false);
    logger.setLevel(LogLevel::DEBUG);

    logger.info("Key generated", "KeyStore");
    logger.error("Peer unreachable");

    std::string contents = readFile(path_);
    EXPECT_NE(contents.find("[INFO] [KeyStore] Key generated"), std::string::npos);
    EXPECT_NE(contents.find("[ERROR] [Core] Peer unreachable"), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowLevel) {
    auto& logger = Logger::instance();
    ASSERT_TRUE(logger.setLogFile(path_));
    logger.setConsoleOutput(false);
    logger.setLevel(LogLevel::WARN);

    EXPECT_FALSE(logger.isDebugEnabled());
    logger.debug("hidden debug");
    logger.info("hidden info");
    logger.warn("shown warning");

    std::string contents = readFile(path_);
    EXPECT_EQ(contents.find("hidden"), std::string::npos);
    EXPECT_NE(contents.find("shown warning"), std::string::npos);
}

TEST(LogLevelTest, ParsesNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parseLogLevel("WARNING", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(parseLogLevel("CRITICAL", level));
    EXPECT_EQ(level, LogLevel::CRITICAL);

    EXPECT_FALSE(parseLogLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::CRITICAL);
}

TEST(LogLevelTest, ShortIdTruncatesLongIds) {
    EXPECT_EQ(shortId("abc"), "abc");
    std::string keyId(32, 'a');
    std::string shortened = shortId(keyId);
    EXPECT_LT(shortened.size(), keyId.size());
    EXPECT_EQ(shortened.substr(shortened.size() - 3), "...");
}
