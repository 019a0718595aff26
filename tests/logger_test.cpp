#include <gtest/gtest.h>
#include "logger.hpp"

TEST(LoggerTest, LevelNames) {
    EXPECT_EQ(logLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(logLevelFromString("warn"), LogLevel::Warn);
    EXPECT_EQ(logLevelFromString("error"), LogLevel::Error);
    EXPECT_EQ(logLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(logLevelFromString("loud"), LogLevel::Debug);
}

TEST(LoggerTest, PhasesAreTallied) {
    PhaseSummary before = phaseSummary();

    LOG_PHASE("Tally ok", true);
    LOG_PHASE("Tally broken", false);

    PhaseSummary after = phaseSummary();
    EXPECT_EQ(after.passed, before.passed + 1);
    EXPECT_EQ(after.failed, before.failed + 1);
    EXPECT_EQ(after.lastFailed, "Tally broken");
}

TEST(LoggerTest, GroupedPhasesStillCount) {
    PhaseSummary before = phaseSummary();

    beginPhaseGroup();
    LOG_PHASE("Grouped", true);
    endPhaseGroup();

    EXPECT_EQ(phaseSummary().passed, before.passed + 1);
}
