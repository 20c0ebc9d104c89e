#include "TimeFormat.h"

#include <gtest/gtest.h>

#include <limits>

using namespace TimeFormat;

TEST(TimeFormatTest, FormatsHoursMinutesSeconds)
{
    EXPECT_EQ(formatHms(0), QString("00:00:00"));
    EXPECT_EQ(formatHms(59.9), QString("00:00:59"));
    EXPECT_EQ(formatHms(3661), QString("01:01:01"));
    EXPECT_EQ(formatHms(36000), QString("10:00:00"));
    EXPECT_EQ(formatHms(360000 + 59), QString("100:00:59"));
}

TEST(TimeFormatTest, InvalidInputFormatsAsZero)
{
    EXPECT_EQ(formatHms(-12), QString("00:00:00"));
    EXPECT_EQ(formatHms(std::numeric_limits<double>::quiet_NaN()), QString("00:00:00"));
    EXPECT_EQ(formatHoursTenths(-1), QString("0.0"));
}

TEST(TimeFormatTest, SplitsIntoComponents)
{
    const Hms t = splitHms(7384.7);
    EXPECT_EQ(t.hours, 2);
    EXPECT_EQ(t.minutes, 3);
    EXPECT_EQ(t.seconds, 4);
}

TEST(TimeFormatTest, FormatsHoursAndMinutes)
{
    EXPECT_EQ(formatHoursMinutes(0), QString("0:00"));
    EXPECT_EQ(formatHoursMinutes(3900), QString("1:05"));
    EXPECT_EQ(formatHoursMinutes(45000), QString("12:30"));
}

TEST(TimeFormatTest, FormatsHoursToOneDecimal)
{
    EXPECT_EQ(formatHoursTenths(0), QString("0.0"));
    EXPECT_EQ(formatHoursTenths(5400), QString("1.5"));
    EXPECT_EQ(formatHoursTenths(3600 * 12 + 200), QString("12.1"));
    EXPECT_EQ(formatHoursTenths(100), QString("0.0"));
}
