#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <thread>
#include <filesystem>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace netfs::logging;

class LoggerTest : public ::testing::Test {
protected:
    TempDir dir{"logger_test"};
    std::string log_file;

    void SetUp() override {
        log_file = (dir / "netfs.log").string();
        init_logging(log_file, boost::log::trivial::trace);
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        quiet_logging();
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();
        return read_file(log_file).find(text) != std::string::npos;
    }
};

TEST_F(LoggerTest, BasicLogging) {
    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("Test error message"));
    EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, ThreadLogging) {
    std::thread t([]() {
        BOOST_LOG_TRIVIAL(info) << "Message from thread";
    });
    t.join();

    EXPECT_TRUE(log_contains("Message from thread"));
    EXPECT_TRUE(log_contains("[Thread "));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    init_logging(log_file, boost::log::trivial::warning);

    BOOST_LOG_TRIVIAL(debug) << "Should not appear";
    BOOST_LOG_TRIVIAL(warning) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, ReinitializingReplacesSinks) {
    init_logging(log_file, boost::log::trivial::info);
    BOOST_LOG_TRIVIAL(info) << "Written once";

    const std::string content = read_file(log_file);
    const auto first = content.find("Written once");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(content.find("Written once", first + 1), std::string::npos);
}

TEST(SeverityParseTest, AcceptsBoostNames) {
    boost::log::trivial::severity_level level = boost::log::trivial::info;
    EXPECT_TRUE(parse_severity("debug", level));
    EXPECT_EQ(level, boost::log::trivial::debug);
    EXPECT_TRUE(parse_severity("error", level));
    EXPECT_EQ(level, boost::log::trivial::error);
    EXPECT_FALSE(parse_severity("loud", level));
    EXPECT_EQ(level, boost::log::trivial::error);
}
