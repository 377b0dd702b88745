#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

#include "datetime/datetime.h"

namespace {

using flakeid::datetime::DateTime;

TEST(DateTimeTest, ParsesInNamedZone) {
    const auto utc = DateTime::Parse("2025-01-01 00:00:00", "%Y-%m-%d %H:%M:%S", "UTC");
    EXPECT_EQ(DateTime::ToUnixMilliseconds(utc), 1735689600000LL);

    const auto berlin = DateTime::Parse("2025-10-01 02:00:00", "", "Europe/Berlin");
    EXPECT_EQ(DateTime::ToUnixSeconds(berlin), 1759276800LL);
}

TEST(DateTimeTest, FormatsInNamedZone) {
    const auto point = DateTime::FromUnixMilliseconds(1760368327984LL);
    EXPECT_EQ(DateTime::Format(point, "%Y-%m-%dT%H:%M:%SZ", "UTC"), "2025-10-13T15:12:07.984Z");
}

TEST(DateTimeTest, RejectsBadInput) {
    EXPECT_THROW(DateTime::Parse("", "", "UTC"), std::invalid_argument);
    EXPECT_THROW(DateTime::Parse("yesterday", "", "UTC"), std::invalid_argument);
    EXPECT_THROW(DateTime::Parse("2025-01-01 00:00:00", "", "Mars/Olympus"), std::invalid_argument);
}

TEST(DateTimeTest, OffsetShiftsNow) {
    DateTime shifted(std::chrono::hours(1));
    const DateTime wall;
    const auto difference = shifted.NowMilliseconds() - wall.NowMilliseconds();
    EXPECT_GE(difference, 3600000 - 1000);
    EXPECT_LE(difference, 3600000 + 1000);

    shifted.SetOffset(std::chrono::milliseconds(0));
    EXPECT_EQ(shifted.Offset(), std::chrono::milliseconds(0));
    EXPECT_EQ(DateTime::FromUnixSeconds(12).time_since_epoch(), std::chrono::milliseconds(12000));
}

}  // namespace
