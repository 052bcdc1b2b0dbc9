#include <gtest/gtest.h>
#include <main/control/day_clock.hpp>
#include "fakes.hpp"

class DayClockTest : public ::testing::Test {
protected:
    void SetUp() override { useUtc(); }
};

TEST_F(DayClockTest, ParsesBothDateForms) {
    PlantingDate d{};
    ASSERT_EQ(DayClock::parseDate("2024-05-01", d), ErrorCode::OK);
    EXPECT_EQ(d.year, 2024);
    EXPECT_EQ(d.month, 5);
    EXPECT_EQ(d.day, 1);

    ASSERT_EQ(DayClock::parseDate("2023 12 31", d), ErrorCode::OK);
    EXPECT_EQ(d.year, 2023);
    EXPECT_EQ(d.month, 12);
    EXPECT_EQ(d.day, 31);
}

TEST_F(DayClockTest, RejectsImpossibleDates) {
    PlantingDate d{2000, 1, 1};
    EXPECT_EQ(DayClock::parseDate("2023-02-30", d), ErrorCode::INVALID_DATE);
    EXPECT_EQ(DayClock::parseDate("2023-13-01", d), ErrorCode::INVALID_DATE);
    EXPECT_EQ(DayClock::parseDate("2023-00-10", d), ErrorCode::INVALID_DATE);
    EXPECT_EQ(DayClock::parseDate("2023-05", d), ErrorCode::INVALID_DATE);
    EXPECT_EQ(DayClock::parseDate("2023-05 01", d), ErrorCode::INVALID_DATE);
    EXPECT_EQ(DayClock::parseDate("yesterday", d), ErrorCode::INVALID_DATE);
    EXPECT_EQ(DayClock::parseDate("2023-05-01x", d), ErrorCode::INVALID_DATE);
    EXPECT_EQ(DayClock::parseDate(nullptr, d), ErrorCode::INVALID_DATE);
    // Untouched on failure
    EXPECT_EQ(d.year, 2000);

    EXPECT_EQ(DayClock::validateDate(PlantingDate{2024, 2, 29}), ErrorCode::OK);
    EXPECT_EQ(DayClock::validateDate(PlantingDate{2023, 2, 29}), ErrorCode::INVALID_DATE);
}

TEST_F(DayClockTest, CountsWholeDaysSincePlanting) {
    int days = -1;
    ASSERT_EQ(DayClock::daysAfterPlanting(PlantingDate{2024, 1, 1}, kJune1st2024, days), ErrorCode::OK);
    EXPECT_EQ(days, 152);

    // 23:59 on the planting day is still day 0
    ASSERT_EQ(DayClock::daysAfterPlanting(PlantingDate{2024, 6, 1}, kJune1st2024 + 86399, days), ErrorCode::OK);
    EXPECT_EQ(days, 0);
    ASSERT_EQ(DayClock::daysAfterPlanting(PlantingDate{2024, 6, 1}, kJune1st2024 + 86400, days), ErrorCode::OK);
    EXPECT_EQ(days, 1);
}

TEST_F(DayClockTest, FuturePlantingClampsToZero) {
    int days = -1;
    ASSERT_EQ(DayClock::daysAfterPlanting(PlantingDate{2024, 7, 15}, kJune1st2024, days), ErrorCode::OK);
    EXPECT_EQ(days, 0);
}

TEST_F(DayClockTest, InvalidPlantingDateLeavesOutputAlone) {
    int days = 77;
    EXPECT_EQ(DayClock::daysAfterPlanting(PlantingDate{2024, 4, 31}, kJune1st2024, days), ErrorCode::INVALID_DATE);
    EXPECT_EQ(days, 77);
}

TEST_F(DayClockTest, FormatsLocalDates) {
    char date[11];
    DayClock::formatDate(kJune1st2024 + 3600, date, sizeof(date));
    EXPECT_STREQ(date, "2024-06-01");

    char stamp[20];
    DayClock::formatDateTime(kJune1st2024 + 3723, stamp, sizeof(stamp));
    EXPECT_STREQ(stamp, "2024-06-01 01:02:03");
}
