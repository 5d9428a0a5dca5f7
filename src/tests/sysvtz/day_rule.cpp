// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <catch2/catch_test_macros.hpp>
#include <fmt/format.h>

#include "sysvtz/calendar.h"
#include "sysvtz/day_rule.h"

namespace SysVTz {

TEST_CASE("DayRule: Julian days skip February 29", "[sysvtz]") {
    for (const s64 year : {2019, 2020, 2100, 2000}) {
        REQUIRE(ResolveDayOfYear(JulianDay{59}, year) == DateToDayOfYear(year, 2, 28));
        REQUIRE(ResolveDayOfYear(JulianDay{60}, year) == DateToDayOfYear(year, 3, 1));
        REQUIRE(ResolveDayOfYear(JulianDay{365}, year) == DateToDayOfYear(year, 12, 31));
    }
    REQUIRE(ResolveDayOfYear(JulianDay{1}, 2020) == 1);
}

TEST_CASE("DayRule: Zero based days count February 29", "[sysvtz]") {
    REQUIRE(ResolveDayOfYear(ZeroBasedDay{0}, 2021) == 1);
    REQUIRE(ResolveDayOfYear(ZeroBasedDay{59}, 2020) == DateToDayOfYear(2020, 2, 29));
    REQUIRE(ResolveDayOfYear(ZeroBasedDay{59}, 2021) == DateToDayOfYear(2021, 3, 1));
    REQUIRE(ResolveDayOfYear(ZeroBasedDay{365}, 2020) == 366);
}

TEST_CASE("DayRule: Month week day", "[sysvtz]") {
    // Second Sunday of March and first Sunday of November
    REQUIRE(ResolveDayOfYear(MonthWeekDay{3, 2, 0}, 2020) == DateToDayOfYear(2020, 3, 8));
    REQUIRE(ResolveDayOfYear(MonthWeekDay{11, 1, 0}, 2020) == DateToDayOfYear(2020, 11, 1));
    REQUIRE(ResolveDayOfYear(MonthWeekDay{3, 2, 0}, 2021) == DateToDayOfYear(2021, 3, 14));

    // Week 5 is the last occurrence in the month
    REQUIRE(ResolveDayOfYear(MonthWeekDay{3, 5, 0}, 2020) == DateToDayOfYear(2020, 3, 29));
    REQUIRE(ResolveDayOfYear(MonthWeekDay{10, 5, 0}, 2021) == DateToDayOfYear(2021, 10, 31));
    REQUIRE(ResolveDayOfYear(MonthWeekDay{2, 5, 6}, 2020) == DateToDayOfYear(2020, 2, 29));
    REQUIRE(ResolveDayOfYear(MonthWeekDay{2, 5, 6}, 2021) == DateToDayOfYear(2021, 2, 27));

    // Saturday, 2000-01-01
    REQUIRE(ResolveDayOfYear(MonthWeekDay{1, 1, 6}, 2000) == 1);
    REQUIRE(ResolveDayOfYear(MonthWeekDay{1, 1, 5}, 2000) == 7);

    for (s64 year = 1990; year < 2030; year++) {
        const s32 day = ResolveDayOfYear(MonthWeekDay{4, 5, 0}, year);
        const s64 day_number = CivilDateToDayNumber({year, 1, 1}) + day - 1;
        REQUIRE(GetWeekdayOfDayNumber(day_number) == 0);
        REQUIRE(DayNumberToCivilDate(day_number).month == 4);
        REQUIRE(DayNumberToCivilDate(day_number + 7).month == 5);
    }
}

TEST_CASE("DayRule: Formatting", "[sysvtz]") {
    REQUIRE(fmt::format("{}", DayRuleSpec{JulianDay{60}}) == "J60");
    REQUIRE(fmt::format("{}", DayRuleSpec{ZeroBasedDay{59}}) == "59");
    REQUIRE(fmt::format("{}", DayRuleSpec{MonthWeekDay{3, 2, 0}}) == "M3.2.0");
}

} // namespace SysVTz
