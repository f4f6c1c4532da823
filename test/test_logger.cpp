#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "logger.h"

namespace {

std::vector<std::string> captured;
unsigned long fakeNow = 0;

void captureOutput(const char* line) {
    captured.push_back(line);
}

unsigned long fakeClock() {
    return fakeNow;
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        captured.clear();
        fakeNow = 0;
        testLogger.setOutput(captureOutput);
        testLogger.setClock(fakeClock);
        testLogger.begin(3);
    }

    Logger testLogger;
};

}  // namespace

TEST_F(LoggerTest, FormatsTimestampAndLevel) {
    fakeNow = 3723004;  // 1:02:03.004
    testLogger.info("Rotator ready");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0], "[1:02:03.004] INFO : Rotator ready");
}

TEST_F(LoggerTest, PrintfVariants) {
    testLogger.warnf("%s: move to %.1f failed", "Azimuth", 12.5f);
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0], "[0:00:00.000] WARN : Azimuth: move to 12.5 failed");
}

TEST_F(LoggerTest, EachPrintfVariantKeepsItsLevel) {
    testLogger.debugf("d%d", 1);
    testLogger.infof("i%d", 2);
    testLogger.warnf("w%d", 3);
    testLogger.errorf("e%d", 4);

    ASSERT_EQ(captured.size(), 4u);
    EXPECT_EQ(captured[0], "[0:00:00.000] DEBUG: d1");
    EXPECT_EQ(captured[3], "[0:00:00.000] ERROR: e4");

    std::vector<LogEntry> entries = testLogger.getEntries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].level, LOG_LEVEL_INFO);
    EXPECT_EQ(entries[0].message, "i2");
    EXPECT_EQ(entries[1].level, LOG_LEVEL_WARN);
    EXPECT_EQ(entries[2].level, LOG_LEVEL_ERROR);
}

TEST_F(LoggerTest, DebugIsPrintedButNotStored) {
    testLogger.debug("noise");
    testLogger.error("boom");

    EXPECT_EQ(captured.size(), 2u);
    std::vector<LogEntry> entries = testLogger.getEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LOG_LEVEL_ERROR);
    EXPECT_EQ(entries[0].message, "boom");
}

TEST_F(LoggerTest, KeepsOnlyNewestEntries) {
    testLogger.info("one");
    testLogger.info("two");
    testLogger.info("three");
    testLogger.info("four");

    std::vector<LogEntry> entries = testLogger.getEntries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].message, "two");
    EXPECT_EQ(entries[2].message, "four");
}

TEST_F(LoggerTest, JsonEscapesQuotesAndBackslashes) {
    fakeNow = 1500;
    testLogger.warn("bad \"line\" C:\\x");

    EXPECT_EQ(testLogger.getEntriesJSON(),
              "[{\"timestamp\":\"0:00:01.500\",\"level\":\"WARN \",\"message\":\"bad \\\"line\\\" C:\\\\x\"}]");
}

TEST_F(LoggerTest, ClearEmptiesStore) {
    testLogger.info("x");
    testLogger.clear();
    EXPECT_TRUE(testLogger.getEntries().empty());
    EXPECT_EQ(testLogger.getEntriesJSON(), "[]");
}
