// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <string>
#include <catch2/catch_test_macros.hpp>

#include "common/logging/backend.h"
#include "sysvtz/calendar.h"
#include "sysvtz/errors.h"
#include "sysvtz/recipe_parser.h"
#include "sysvtz/transition_engine.h"

namespace SysVTz {
namespace {
CivilInstant Utc(s64 year, s32 month, s32 day, s32 hour, s32 minute, s32 second) {
    return {
        .day_number = CivilDateToDayNumber({year, month, day}),
        .seconds_of_day = static_cast<u32>(hour * 3600 + minute * 60 + second),
    };
}

bool IsDst(const TimeZoneDescriptor& descriptor, const CivilInstant& utc) {
    bool is_dst{};
    REQUIRE(IsDstForInstant(is_dst, descriptor, utc) == ResultSuccess);
    return is_dst;
}

TimeZoneDescriptor Parse(const char* recipe) {
    TimeZoneDescriptor descriptor{};
    REQUIRE(ParseRecipe(descriptor, recipe) == ResultSuccess);
    return descriptor;
}
} // Anonymous namespace

TEST_CASE("TransitionEngine: Fixed offset", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();
    const auto est = Parse("EST5");

    for (const auto& instant : {Utc(2020, 1, 1, 0, 0, 0), Utc(2020, 7, 1, 0, 0, 0),
                                Utc(1900, 3, 8, 7, 0, 0), Utc(2400, 12, 31, 23, 59, 59)}) {
        REQUIRE(!IsDst(est, instant));

        s32 offset{};
        REQUIRE(OffsetForInstant(offset, est, instant) == ResultSuccess);
        REQUIRE(offset == -18000);

        std::string abbreviation;
        REQUIRE(AbbreviationForInstant(abbreviation, est, instant) == ResultSuccess);
        REQUIRE(abbreviation == "EST");
    }

    YearTransitions transitions{};
    REQUIRE(GetTransitionsForYear(transitions, est, 2020) == ResultNoDaylightSaving);
}

TEST_CASE("TransitionEngine: US Eastern", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();
    const auto eastern = Parse("EST5EDT,M3.2.0,M11.1.0");

    s32 offset{};
    std::string abbreviation;

    REQUIRE(!IsDst(eastern, Utc(2020, 1, 1, 0, 0, 0)));
    REQUIRE(OffsetForInstant(offset, eastern, Utc(2020, 1, 1, 0, 0, 0)) == ResultSuccess);
    REQUIRE(offset == -18000);
    REQUIRE(AbbreviationForInstant(abbreviation, eastern, Utc(2020, 1, 1, 0, 0, 0)) ==
            ResultSuccess);
    REQUIRE(abbreviation == "EST");

    REQUIRE(IsDst(eastern, Utc(2020, 7, 1, 0, 0, 0)));
    REQUIRE(OffsetForInstant(offset, eastern, Utc(2020, 7, 1, 0, 0, 0)) == ResultSuccess);
    REQUIRE(offset == -14400);
    REQUIRE(AbbreviationForInstant(abbreviation, eastern, Utc(2020, 7, 1, 0, 0, 0)) ==
            ResultSuccess);
    REQUIRE(abbreviation == "EDT");

    REQUIRE(!IsDst(eastern, Utc(2020, 3, 8, 6, 59, 59)));
    REQUIRE(IsDst(eastern, Utc(2020, 3, 8, 7, 0, 0)));
    REQUIRE(IsDst(eastern, Utc(2020, 11, 1, 5, 59, 59)));
    REQUIRE(!IsDst(eastern, Utc(2020, 11, 1, 6, 0, 0)));
}

TEST_CASE("TransitionEngine: Leap second clamping", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();
    const auto eastern = Parse("EST5EDT,M3.2.0,M11.1.0");

    CivilInstant leap_second = Utc(2016, 12, 31, 0, 0, 0);
    leap_second.seconds_of_day = 86400;
    REQUIRE(!IsDst(eastern, leap_second));

    // Ends at 01:00 daylight time on July 20, which is 00:00 UT
    const auto zone = Parse("AAA0BBB,J100/0,J201/1");
    CivilInstant before_end = Utc(2021, 7, 19, 0, 0, 0);
    before_end.seconds_of_day = 86400;
    REQUIRE(IsDst(zone, before_end));
}

TEST_CASE("TransitionEngine: Southern hemisphere", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();
    const auto sydney = Parse("EST-10EST,M10.5.0,M3.5.0/3");

    REQUIRE(IsDst(sydney, Utc(2021, 1, 15, 0, 0, 0)));
    REQUIRE(!IsDst(sydney, Utc(2021, 6, 15, 0, 0, 0)));
    REQUIRE(IsDst(sydney, Utc(2021, 12, 15, 0, 0, 0)));

    // DST ends 2021-03-28 03:00 local daylight time, 2021-03-27 16:00 UT
    REQUIRE(IsDst(sydney, Utc(2021, 3, 27, 15, 59, 59)));
    REQUIRE(!IsDst(sydney, Utc(2021, 3, 27, 16, 0, 0)));

    // DST starts 2021-10-31 02:00 local standard time, 2021-10-30 16:00 UT
    REQUIRE(!IsDst(sydney, Utc(2021, 10, 30, 15, 59, 59)));
    REQUIRE(IsDst(sydney, Utc(2021, 10, 30, 16, 0, 0)));
}

TEST_CASE("TransitionEngine: Change on the previous UT day", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();
    // Starts on January 1 at 02:00 local, which is December 31 at 16:00 UT
    const auto zone = Parse("AAA-10BBB,J1,J180");

    REQUIRE(!IsDst(zone, Utc(2020, 12, 31, 15, 59, 59)));
    REQUIRE(IsDst(zone, Utc(2020, 12, 31, 16, 0, 0)));
    REQUIRE(IsDst(zone, Utc(2021, 1, 1, 0, 0, 0)));
}

TEST_CASE("TransitionEngine: Transitions per year", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();

    for (const char* recipe : {"EST5EDT,M3.2.0,M11.1.0", "GMT0BST,M3.5.0/1,M10.5.0",
                               "EST-10EST,M10.5.0,M3.5.0/3", "NST3:30NDT,M3.2.0/0:01,M11.1.0/0:01",
                               "EST5EDT", "AAA3BBB,J60,300"}) {
        INFO(recipe);
        const auto zone = Parse(recipe);

        for (s64 year = 1995; year <= 2030; year++) {
            YearTransitions transitions{};
            REQUIRE(GetTransitionsForYear(transitions, zone, year) == ResultSuccess);
            REQUIRE(DayNumberToCivilDate(transitions.dst_start.day_number).year == year);
            REQUIRE(DayNumberToCivilDate(transitions.dst_end.day_number).year == year);

            const auto start = CivilInstantToUnixSeconds(transitions.dst_start);
            const auto end = CivilInstantToUnixSeconds(transitions.dst_end);
            REQUIRE(!IsDst(zone, CivilInstantFromUnixSeconds(start - 1)));
            REQUIRE(IsDst(zone, CivilInstantFromUnixSeconds(start)));
            REQUIRE(IsDst(zone, CivilInstantFromUnixSeconds(end - 1)));
            REQUIRE(!IsDst(zone, CivilInstantFromUnixSeconds(end)));

            // Constant between consecutive transitions
            const bool start_first = start < end;
            const auto middle = start_first ? start + (end - start) / 2 : end + (start - end) / 2;
            REQUIRE(IsDst(zone, CivilInstantFromUnixSeconds(middle)) == start_first);
        }
    }

    const auto eastern = Parse("EST5EDT,M3.2.0,M11.1.0");
    YearTransitions transitions{};
    REQUIRE(GetTransitionsForYear(transitions, eastern, 2020) == ResultSuccess);
    REQUIRE(transitions.dst_start == Utc(2020, 3, 8, 7, 0, 0));
    REQUIRE(transitions.dst_end == Utc(2020, 11, 1, 6, 0, 0));
}

} // namespace SysVTz
