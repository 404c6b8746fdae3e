#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "core/Logging.h"
#include <sstream>
#include <thread>
#include <vector>

namespace pattern_harness {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Info);
        Logger::instance().set_sink(&captured);
    }

    void TearDown() override {
        Logger::instance().set_sink(nullptr);
        Logger::instance().set_level(LogLevel::Info);
    }

    std::ostringstream captured;
};

TEST_F(LoggingTest, SingletonInstance) {
    Logger& logger1 = Logger::instance();
    Logger& logger2 = Logger::instance();
    EXPECT_EQ(&logger1, &logger2);
}

TEST_F(LoggingTest, SetLogLevel) {
    Logger& logger = Logger::instance();

    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);

    logger.set_level(LogLevel::Error);
    EXPECT_EQ(logger.level(), LogLevel::Error);

    logger.set_level(LogLevel::Trace);
    EXPECT_EQ(logger.level(), LogLevel::Trace);
}

TEST_F(LoggingTest, LogLevelEnumValues) {
    EXPECT_EQ(static_cast<int>(LogLevel::Error), 0);
    EXPECT_EQ(static_cast<int>(LogLevel::Warn), 1);
    EXPECT_EQ(static_cast<int>(LogLevel::Info), 2);
    EXPECT_EQ(static_cast<int>(LogLevel::Debug), 3);
    EXPECT_EQ(static_cast<int>(LogLevel::Trace), 4);
}

TEST_F(LoggingTest, PrefixesEachLine) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Trace);

    logger.error("e");
    logger.warn("w");
    logger.info("i");
    logger.debug("d");
    logger.trace("t");

    EXPECT_EQ(captured.str(), "[ERROR] e\n[WARN] w\n[INFO] i\n[DEBUG] d\n[TRACE] t\n");
}

TEST_F(LoggingTest, LogLevelFiltering) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Warn);

    logger.error("kept error");
    logger.warn("kept warning");
    logger.info("dropped info");
    logger.debug("dropped debug");

    std::string out = captured.str();
    EXPECT_THAT(out, ::testing::HasSubstr("kept error"));
    EXPECT_THAT(out, ::testing::HasSubstr("kept warning"));
    EXPECT_THAT(out, ::testing::Not(::testing::HasSubstr("dropped")));
    EXPECT_TRUE(logger.enabled(LogLevel::Warn));
    EXPECT_FALSE(logger.enabled(LogLevel::Info));
}

TEST_F(LoggingTest, EmptyAndLongMessages) {
    Logger& logger = Logger::instance();
    logger.info("");
    std::string long_message(10000, 'A');
    logger.info(long_message);
    EXPECT_EQ(captured.str(), "[INFO] \n[INFO] " + long_message + "\n");
}

TEST_F(LoggingTest, ThreadSafety) {
    Logger& logger = Logger::instance();

    const int num_threads = 8;
    const int logs_per_thread = 50;
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&logger, i]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                logger.info("thread " + std::to_string(i) + " log " + std::to_string(j));
            }
        });
    }
    for (auto& thread : threads) thread.join();

    // every line arrives whole
    std::istringstream is(captured.str());
    std::string line;
    int count = 0;
    while (std::getline(is, line)) {
        EXPECT_EQ(line.rfind("[INFO] thread ", 0), 0u) << line;
        ++count;
    }
    EXPECT_EQ(count, num_threads * logs_per_thread);
}

TEST_F(LoggingTest, ParseLogLevel) {
    LogLevel lvl = LogLevel::Info;
    EXPECT_TRUE(parse_log_level("error", lvl));
    EXPECT_EQ(lvl, LogLevel::Error);
    EXPECT_TRUE(parse_log_level("WARN", lvl));
    EXPECT_EQ(lvl, LogLevel::Warn);
    EXPECT_TRUE(parse_log_level("warning", lvl));
    EXPECT_EQ(lvl, LogLevel::Warn);
    EXPECT_TRUE(parse_log_level("Debug", lvl));
    EXPECT_EQ(lvl, LogLevel::Debug);
    EXPECT_TRUE(parse_log_level("trace", lvl));
    EXPECT_EQ(lvl, LogLevel::Trace);

    EXPECT_FALSE(parse_log_level("loud", lvl));
    EXPECT_FALSE(parse_log_level("", lvl));
    EXPECT_EQ(lvl, LogLevel::Trace);
}

}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
