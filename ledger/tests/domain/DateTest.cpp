#include <gtest/gtest.h>

#include "domain/Date.hpp"
#include "domain/WeeklyPeriod.hpp"

using namespace budget::domain;

TEST(DateTest, ParseAndFormat) {
    auto d = Date::fromString("2024-02-29");

    EXPECT_EQ(d.toString(), "2024-02-29");
    EXPECT_EQ(Date::fromString("1970-01-01").days, 0);
}

TEST(DateTest, RejectsInvalidDates) {
    EXPECT_THROW(Date::fromString("2023-02-29"), std::invalid_argument);
    EXPECT_THROW(Date::fromString("2024-13-01"), std::invalid_argument);
    EXPECT_THROW(Date::fromString("2024-1-1"), std::invalid_argument);
    EXPECT_THROW(Date::fromString("yesterday"), std::invalid_argument);
}

TEST(DateTest, Weekday_MondayIsZero) {
    EXPECT_EQ(Date::fromString("2024-01-01").weekday(), 0);    // понедельник
    EXPECT_EQ(Date::fromString("2024-01-07").weekday(), 6);    // воскресенье
    EXPECT_EQ(Date::fromString("1970-01-01").weekday(), 3);    // четверг
}

TEST(DateTest, FromUnixSeconds_AppliesOwnerOffset) {
    const int64_t sundayLateUtc = 1704670200;   // 2024-01-07 23:30 UTC

    EXPECT_EQ(Date::fromUnixSeconds(sundayLateUtc).toString(), "2024-01-07");
    EXPECT_EQ(Date::fromUnixSeconds(sundayLateUtc, 60).toString(), "2024-01-08");
    EXPECT_EQ(Date::fromUnixSeconds(sundayLateUtc, -600).toString(), "2024-01-07");
    EXPECT_EQ(Date::fromUnixSeconds(1704067200 + 3600, -120).toString(), "2023-12-31");
    EXPECT_EQ(Date::fromUnixSeconds(-1).toString(), "1969-12-31");
}

TEST(DateTest, StartOfWeek) {
    auto wednesday = Date::fromString("2024-01-10");

    EXPECT_EQ(wednesday.startOfWeek(0), Date::fromString("2024-01-08"));
    EXPECT_EQ(wednesday.startOfWeek(2), wednesday);
    EXPECT_EQ(wednesday.startOfWeek(6), Date::fromString("2024-01-07"));
}

TEST(DateTest, AddDaysAcrossYear) {
    auto d = Date::fromString("2023-12-28").addDays(7);

    EXPECT_EQ(d.toString(), "2024-01-04");
    EXPECT_EQ(Date::fromString("2023-12-28").daysUntil(d), 7);
}

TEST(WeeklyPeriodTest, EndIsExclusive) {
    WeeklyPeriod period("p1", "owner", Date::fromString("2024-01-01"));

    EXPECT_EQ(period.endDate, Date::fromString("2024-01-08"));
    EXPECT_TRUE(period.contains(Date::fromString("2024-01-01")));
    EXPECT_TRUE(period.contains(Date::fromString("2024-01-07")));
    EXPECT_FALSE(period.contains(Date::fromString("2024-01-08")));
}

TEST(WeeklyPeriodTest, Overlaps) {
    WeeklyPeriod period("p1", "owner", Date::fromString("2024-01-08"));

    EXPECT_TRUE(period.overlaps(Date::fromString("2024-01-01"), Date::fromString("2024-01-09")));
    EXPECT_FALSE(period.overlaps(Date::fromString("2024-01-01"), Date::fromString("2024-01-08")));
    EXPECT_FALSE(period.overlaps(Date::fromString("2024-01-15"), Date::fromString("2024-01-20")));
}
