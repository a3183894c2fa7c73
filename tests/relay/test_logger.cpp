#include <gtest/gtest.h>
#include <relay/util/logger.hpp>

#include <utility>
#include <vector>

using namespace relay;

namespace {

class CapturingLogger : public Logger {
public:
    void log(LogLevel level, const std::string& message) override {
        if (!enabled(level)) return;
        entries.emplace_back(level, message);
    }

    std::vector<std::pair<LogLevel, std::string>> entries;
};

}  // namespace

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        set_logger(nullptr);
    }
};

TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::WARNING);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::INFO);
}

TEST_F(LoggerTest, InstalledLoggerReceivesMessages) {
    auto capture = std::make_shared<CapturingLogger>();
    set_logger(capture);

    logger()->info("ready");
    logger()->error("broken");

    ASSERT_EQ(capture->entries.size(), 2u);
    EXPECT_EQ(capture->entries[0].first, LogLevel::INFO);
    EXPECT_EQ(capture->entries[0].second, "ready");
    EXPECT_EQ(capture->entries[1].first, LogLevel::ERROR);
}

TEST_F(LoggerTest, MinLevelFilters) {
    auto capture = std::make_shared<CapturingLogger>();
    capture->set_min_level(LogLevel::WARNING);
    set_logger(capture);

    logger()->debug("noise");
    logger()->info("noise");
    logger()->warning("kept");

    ASSERT_EQ(capture->entries.size(), 1u);
    EXPECT_EQ(capture->entries[0].second, "kept");
    EXPECT_FALSE(capture->enabled(LogLevel::INFO));
    EXPECT_TRUE(capture->enabled(LogLevel::ERROR));
}

TEST_F(LoggerTest, NullRestoresDefault) {
    auto capture = std::make_shared<CapturingLogger>();
    set_logger(capture);
    set_logger(nullptr);

    ASSERT_NE(logger(), nullptr);
    logger()->error("dropped");
    EXPECT_TRUE(capture->entries.empty());
}
