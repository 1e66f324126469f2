/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <agentwatch/utils/logger.hpp>

#include <algorithm>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace agentwatch::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::TRACE);
        Logger::instance().setColorEnabled(false);
        Logger::instance().setOutput(&captured_);
    }

    void TearDown() override {
        Logger::instance().setOutput(nullptr);
        Logger::instance().setLevel(LogLevel::INFO);
    }

    std::string output() const { return captured_.str(); }

    std::ostringstream captured_;
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
    LOG_WARN("Test", "visible warn");
    LOG_ERROR("Test", "visible error");

    std::string text = output();
    EXPECT_EQ(text.find("filtered"), std::string::npos);
    EXPECT_NE(text.find("visible warn"), std::string::npos);
    EXPECT_NE(text.find("visible error"), std::string::npos);
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::instance().setLevel(LogLevel::OFF);
    LOG_ERROR("Test", "nothing");
    EXPECT_TRUE(output().empty());
    EXPECT_FALSE(Logger::instance().isEnabled(LogLevel::OFF));
}

TEST_F(LoggerTest, LogLevelNames) {
    EXPECT_STREQ(logLevelToString(LogLevel::TRACE), "TRACE");
    EXPECT_STREQ(logLevelToString(LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(logLevelToString(LogLevel::INFO), "INFO ");
    EXPECT_STREQ(logLevelToString(LogLevel::WARN), "WARN ");
    EXPECT_STREQ(logLevelToString(LogLevel::ERROR), "ERROR");
    EXPECT_STREQ(logLevelToString(LogLevel::FATAL), "FATAL");
}

TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::TRACE);
    EXPECT_EQ(parseLogLevel("Debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("none"), LogLevel::OFF);
    EXPECT_EQ(parseLogLevel("bogus"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("bogus", LogLevel::WARN), LogLevel::WARN);
}

TEST_F(LoggerTest, PlaceholdersAreSubstitutedInOrder) {
    LOG_INFO("Cache", "New instance {} via {}", "pid:42", "proc");
    EXPECT_NE(output().find("New instance pid:42 via proc"), std::string::npos);
}

TEST_F(LoggerTest, ExtraPlaceholdersStayLiteral) {
    LOG_INFO("Test", "a={} b={}", 1);
    EXPECT_NE(output().find("a=1 b={}"), std::string::npos);
}

TEST_F(LoggerTest, ComponentTagAndLevelAppear) {
    LOG_WARN("MyComponent", "Test message");
    std::string text = output();
    EXPECT_NE(text.find("[WARN ]"), std::string::npos);
    EXPECT_NE(text.find("[MyComponent] Test message"), std::string::npos);
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 10;
    const int logs_per_thread = 100;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i, logs_per_thread]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_INFO("Thread", "worker {} message {}", i, j);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    std::string text = output();
    size_t lines = static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
    EXPECT_EQ(lines, static_cast<size_t>(num_threads * logs_per_thread));
}
