// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>

#include "calendar.hpp"

#include "common/gtest_utils.hpp"

using namespace pnr;

namespace {

TEST(TestCalendar, ValidDates)
{
    EXPECT_TRUE(is_valid_date(81, 12, 18));
    EXPECT_TRUE(is_valid_date(0, 1, 1));
    EXPECT_TRUE(is_valid_date(99, 12, 31));
    EXPECT_TRUE(is_valid_date(64, 8, 23));
}

TEST(TestCalendar, DaysPerMonth)
{
    // Non-leap year
    constexpr std::array<unsigned, 12> days{31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    for (unsigned month = 1; month <= 12; ++month) {
        EXPECT_TRUE(is_valid_date(81, month, days[month - 1])) << month;
        EXPECT_FALSE(is_valid_date(81, month, days[month - 1] + 1)) << month;
        EXPECT_FALSE(is_valid_date(81, month, 0)) << month;
    }
}

TEST(TestCalendar, InvalidMonth)
{
    EXPECT_FALSE(is_valid_date(81, 0, 18));
    EXPECT_FALSE(is_valid_date(81, 13, 18));
    EXPECT_FALSE(is_valid_date(81, 99, 18));
}

TEST(TestCalendar, LeapYearsResolvedWithinTwoThousands)
{
    // 2000 is a leap year
    EXPECT_TRUE(is_valid_date(0, 2, 29));
    EXPECT_TRUE(is_valid_date(4, 2, 29));
    EXPECT_TRUE(is_valid_date(96, 2, 29));

    EXPECT_FALSE(is_valid_date(1, 2, 29));
    EXPECT_FALSE(is_valid_date(99, 2, 29));
    EXPECT_FALSE(is_valid_date(0, 2, 30));
}

TEST(TestCalendar, CoordinationDays)
{
    EXPECT_TRUE(is_valid_date(81, 12, 61));
    EXPECT_TRUE(is_valid_date(81, 12, 78));
    EXPECT_TRUE(is_valid_date(81, 12, 91));
    EXPECT_TRUE(is_valid_date(0, 2, 89));

    EXPECT_FALSE(is_valid_date(81, 11, 91));
    EXPECT_FALSE(is_valid_date(81, 12, 92));
    EXPECT_FALSE(is_valid_date(1, 2, 89));
    EXPECT_FALSE(is_valid_date(81, 12, 99));
}

TEST(TestCalendar, DaysBetweenMonthEndAndCoordinationOffset)
{
    for (unsigned day = 32; day <= coordination_day_offset; ++day) {
        EXPECT_FALSE(is_valid_date(81, 1, day)) << day;
    }
}

TEST(TestCalendar, OutOfRangeYear)
{
    EXPECT_FALSE(is_valid_date(100, 1, 1));
    EXPECT_FALSE(is_valid_date(1981, 12, 18));
}

} // namespace
