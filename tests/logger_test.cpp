#include <gtest/gtest.h>

#include "logger.hpp"

#include <thread>

TEST(Logger, LevelNames) {
    LogLevel before = getLogLevel();

    EXPECT_TRUE(setLogLevelByName("error"));
    EXPECT_EQ(getLogLevel(), LogLevel::Error);
    EXPECT_TRUE(setLogLevelByName("off"));
    EXPECT_EQ(getLogLevel(), LogLevel::Off);

    EXPECT_FALSE(setLogLevelByName("verbose"));
    EXPECT_EQ(getLogLevel(), LogLevel::Off);

    setLogLevel(before);
}

TEST(Logger, ThreadLabelIsPerThread) {
    setThreadLabel("main-test");

    std::string seen = "unset";
    std::thread worker([&seen]() {
        seen = threadLabel();
        setThreadLabel("worker");
    });
    worker.join();

    EXPECT_EQ(seen, "");
    EXPECT_EQ(threadLabel(), "main-test");

    setThreadLabel("");
    EXPECT_TRUE(threadLabel().empty());
}

TEST(Logger, PhaseRecordsThreadLabel) {
    setLogEcho(false);
    setThreadLabel("phase-test");
    LOG_PHASE("Logger phase check", true);
    EXPECT_EQ(g_phaseInfo.phaseName, "Logger phase check");
    EXPECT_EQ(g_phaseInfo.thread, "phase-test");
    EXPECT_EQ(g_phaseInfo.fileName, "logger_test.cpp");

    setThreadLabel("");
    LOG_PHASE("Logger phase check", false);
    EXPECT_EQ(g_phaseInfo.thread, "main");
    EXPECT_FALSE(g_phaseInfo.success);
    setLogEcho(true);
}
