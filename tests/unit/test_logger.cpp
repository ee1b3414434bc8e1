/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <uuidkit/utils/logger.hpp>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace uuidkit::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::TRACE);
        Logger::instance().setColorEnabled(false);
        Logger::instance().setOutput(&output_);
    }

    void TearDown() override {
        Logger::instance().setOutput(nullptr);
        Logger::instance().setColorEnabled(true);
        Logger::instance().setLevel(LogLevel::INFO);
    }

    std::ostringstream output_;
};

TEST_F(LoggerTest, SingletonInstance) {
    auto& instance1 = Logger::instance();
    auto& instance2 = Logger::instance();
    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::instance().setLevel(LogLevel::WARN);

    LOG_TRACE("Test", "filtered trace");
    LOG_DEBUG("Test", "filtered debug");
    LOG_INFO("Test", "filtered info");
    EXPECT_TRUE(output_.str().empty());

    LOG_WARN("Test", "visible warn");
    LOG_ERROR("Test", "visible error");

    std::string text = output_.str();
    EXPECT_NE(text.find("visible warn"), std::string::npos);
    EXPECT_NE(text.find("visible error"), std::string::npos);
    EXPECT_EQ(text.find("filtered"), std::string::npos);
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::instance().setLevel(LogLevel::OFF);
    LOG_FATAL("Test", "should not appear");
    EXPECT_TRUE(output_.str().empty());
    EXPECT_FALSE(Logger::instance().isEnabled(LogLevel::OFF));
}

TEST_F(LoggerTest, LogLevelNames) {
    EXPECT_EQ(Logger::levelName(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(Logger::levelName(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(Logger::levelName(LogLevel::INFO), "INFO");
    EXPECT_EQ(Logger::levelName(LogLevel::WARN), "WARN");
    EXPECT_EQ(Logger::levelName(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(Logger::levelName(LogLevel::FATAL), "FATAL");
}

TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::OFF);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
    EXPECT_FALSE(parseLogLevel("").has_value());
}

TEST_F(LoggerTest, PlaceholderSubstitution) {
    LOG_INFO("Fmt", "node {} has {} bytes", "eth0", 6);
    EXPECT_NE(output_.str().find("node eth0 has 6 bytes"), std::string::npos);
}

TEST_F(LoggerTest, ComponentTag) {
    LOG_INFO("MyComponent", "Test message");
    std::string text = output_.str();
    EXPECT_NE(text.find("[INFO ]"), std::string::npos);
    EXPECT_NE(text.find("[MyComponent] Test message"), std::string::npos);
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 10;
    const int logs_per_thread = 100;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_INFO("Thread", "thread {} message {}", i, j);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    std::istringstream lines(output_.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        ++count;
    }
    EXPECT_EQ(count, num_threads * logs_per_thread);
}
