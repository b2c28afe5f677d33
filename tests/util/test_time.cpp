// TRIBUTARY - Time Utility Tests
// Copyright (c) 2024 TRIBUTARY Developers
// MIT License

#include <gtest/gtest.h>

#include "tributary/util/time.h"

#include <stdexcept>

namespace tributary {
namespace util {
namespace test {

// ============================================================================
// Epoch Clock
// ============================================================================

TEST(EpochClockTest, AlignsToPeriod) {
    EXPECT_EQ(EpochStart(0, SECONDS_PER_WEEK), 0);
    EXPECT_EQ(EpochStart(SECONDS_PER_WEEK - 1, SECONDS_PER_WEEK), 0);
    EXPECT_EQ(EpochStart(SECONDS_PER_WEEK, SECONDS_PER_WEEK), SECONDS_PER_WEEK);
    EXPECT_EQ(EpochStart(1700000000, SECONDS_PER_WEEK), 1699488000);
}

TEST(EpochClockTest, NegativeTimestampsRoundDown) {
    EXPECT_EQ(EpochStart(-1, 100), -100);
    EXPECT_EQ(EpochStart(-100, 100), -100);
    EXPECT_EQ(EpochStart(-101, 100), -200);
}

TEST(EpochClockTest, RejectsNonPositivePeriod) {
    EXPECT_THROW(EpochStart(10, 0), std::invalid_argument);
    EXPECT_THROW(EpochStart(10, -5), std::invalid_argument);
}

TEST(EpochClockTest, NextEpochStart) {
    EXPECT_EQ(NextEpochStart(0, 3600), 3600);
    EXPECT_EQ(NextEpochStart(3599, 3600), 3600);
    EXPECT_EQ(NextEpochStart(3600, 3600), 7200);
}

// ============================================================================
// Formatting
// ============================================================================

TEST(TimeFormatTest, ISO8601) {
    EXPECT_EQ(FormatISO8601(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(1700000000), "2023-11-14T22:13:20Z");
}

TEST(TimeFormatTest, Duration) {
    EXPECT_EQ(FormatDuration(Seconds{0}), "0s");
    EXPECT_EQ(FormatDuration(Seconds{45}), "45s");
    EXPECT_EQ(FormatDuration(Seconds{3600}), "1h");
    EXPECT_EQ(FormatDuration(Seconds{93784}), "1d 2h 3m 4s");
    EXPECT_EQ(FormatDuration(Seconds{-60}), "-1m");
}

TEST(TimeConversionTest, UnixRoundTrip) {
    EXPECT_EQ(ToUnixTime(FromUnixTime(1234567890)), 1234567890);
}

// ============================================================================
// Mock Time
// ============================================================================

class MockTimeTest : public ::testing::Test {
protected:
    void TearDown() override {
        DisableMockTime();
    }
};

TEST_F(MockTimeTest, SetAndAdvance) {
    EnableMockTime();
    SetMockTime(1000);
    EXPECT_TRUE(IsMockTimeEnabled());
    EXPECT_EQ(GetTime(), 1000);
    EXPECT_EQ(GetTimeMillis(), 1000000);
    EXPECT_EQ(ToUnixTime(GetSystemTime()), 1000);

    AdvanceMockTime(Seconds{SECONDS_PER_DAY});
    EXPECT_EQ(GetTime(), 1000 + SECONDS_PER_DAY);
    EXPECT_EQ(GetMockTime(), 1000 + SECONDS_PER_DAY);
}

TEST_F(MockTimeTest, DisableRestoresWallClock) {
    EnableMockTime();
    SetMockTime(5);
    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_GT(GetTime(), 1600000000);
}

TEST_F(MockTimeTest, EnableKeepsExistingMockValue) {
    SetMockTime(42);
    EnableMockTime();
    EXPECT_EQ(GetTime(), 42);
}

} // namespace test
} // namespace util
} // namespace tributary
