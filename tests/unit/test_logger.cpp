/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <crossmesh/utils/logger.hpp>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace crossmesh::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::TRACE);
        Logger::instance().setColorEnabled(false);
        Logger::instance().setSink(&output_);
    }

    void TearDown() override {
        Logger::instance().setSink(nullptr);
        Logger::instance().setColorEnabled(true);
        Logger::instance().setLevel(LogLevel::INFO);
    }

    std::string output() const { return output_.str(); }

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
}

TEST_F(LoggerTest, PlaceholdersAreSubstitutedInOrder) {
    LOG_INFO("ConnectionManager", "Connected to {} via {} in {}ms", "cluster-b", "relay", 42);
    EXPECT_NE(output().find("Connected to cluster-b via relay in 42ms"), std::string::npos);
}

TEST_F(LoggerTest, ExtraArgumentsAreAppended) {
    LOG_INFO("Test", "value", 7);
    EXPECT_NE(output().find("value 7"), std::string::npos);
}

TEST_F(LoggerTest, ComponentTagAndLevelAppear) {
    LOG_WARN("MyComponent", "Test message");
    std::string text = output();
    EXPECT_NE(text.find("[MyComponent]"), std::string::npos);
    EXPECT_NE(text.find("[WARN ]"), std::string::npos);
}

TEST_F(LoggerTest, LogIfRespectsCondition) {
    LOG_IF(LogLevel::INFO, "Test", false, "hidden");
    LOG_IF(LogLevel::INFO, "Test", true, "shown");
    EXPECT_EQ(output().find("hidden"), std::string::npos);
    EXPECT_NE(output().find("shown"), std::string::npos);
}

TEST_F(LoggerTest, LevelNamesParseCaseInsensitively) {
    EXPECT_EQ(logLevelFromString("trace"), LogLevel::TRACE);
    EXPECT_EQ(logLevelFromString("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(logLevelFromString("Info"), LogLevel::INFO);
    EXPECT_EQ(logLevelFromString("warn"), LogLevel::WARN);
    EXPECT_EQ(logLevelFromString("warning"), LogLevel::WARN);
    EXPECT_EQ(logLevelFromString("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(logLevelFromString("fatal"), LogLevel::FATAL);
    EXPECT_EQ(logLevelFromString("off"), LogLevel::OFF);
    EXPECT_EQ(logLevelFromString("bogus"), LogLevel::INFO);
    EXPECT_EQ(logLevelFromString("bogus", LogLevel::ERROR), LogLevel::ERROR);
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 8;
    const int logs_per_thread = 50;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_INFO("Thread", "worker {} message {}", i, j);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::istringstream lines(output());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        EXPECT_NE(line.find("[Thread] worker"), std::string::npos) << line;
        ++count;
    }
    EXPECT_EQ(count, num_threads * logs_per_thread);
}
