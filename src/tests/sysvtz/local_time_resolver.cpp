// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <catch2/catch_test_macros.hpp>

#include "common/logging/backend.h"
#include "sysvtz/calendar.h"
#include "sysvtz/errors.h"
#include "sysvtz/local_time_resolver.h"
#include "sysvtz/recipe_parser.h"

namespace SysVTz {
namespace {
CivilInstant Local(s64 year, s32 month, s32 day, s32 hour, s32 minute, s32 second) {
    return {
        .day_number = CivilDateToDayNumber({year, month, day}),
        .seconds_of_day = static_cast<u32>(hour * 3600 + minute * 60 + second),
    };
}

TimeZoneDescriptor Parse(const char* recipe) {
    TimeZoneDescriptor descriptor{};
    REQUIRE(ParseRecipe(descriptor, recipe) == ResultSuccess);
    return descriptor;
}
} // Anonymous namespace

TEST_CASE("LocalTimeResolver: Fixed offset", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();
    const auto mauritius = Parse("MUT-4");

    s32 offset{};
    bool is_dst = true;
    REQUIRE(OffsetForLocal(offset, mauritius, Local(2020, 3, 8, 2, 30, 0)) == ResultSuccess);
    REQUIRE(offset == 14400);
    REQUIRE(IsDstForLocal(is_dst, mauritius, Local(2020, 3, 8, 2, 30, 0)) == ResultSuccess);
    REQUIRE(!is_dst);
}

TEST_CASE("LocalTimeResolver: US Eastern", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();
    const auto eastern = Parse("EST5EDT,M3.2.0,M11.1.0");

    s32 offset{};
    bool is_dst{};

    REQUIRE(OffsetForLocal(offset, eastern, Local(2020, 1, 15, 12, 0, 0)) == ResultSuccess);
    REQUIRE(offset == -18000);
    REQUIRE(OffsetForLocal(offset, eastern, Local(2020, 7, 1, 12, 0, 0)) == ResultSuccess);
    REQUIRE(offset == -14400);
    REQUIRE(IsDstForLocal(is_dst, eastern, Local(2020, 7, 1, 12, 0, 0)) == ResultSuccess);
    REQUIRE(is_dst);

    // Repeated hour resolves to the smaller offset
    REQUIRE(OffsetForLocal(offset, eastern, Local(2020, 11, 1, 1, 30, 0)) == ResultSuccess);
    REQUIRE(offset == -18000);
    REQUIRE(IsDstForLocal(is_dst, eastern, Local(2020, 11, 1, 1, 30, 0)) == ResultSuccess);
    REQUIRE(!is_dst);

    // Skipped hour
    offset = 42;
    REQUIRE(OffsetForLocal(offset, eastern, Local(2020, 3, 8, 2, 30, 0)) ==
            ResultNonExistentLocalTime);
    REQUIRE(offset == 42);
    REQUIRE(IsDstForLocal(is_dst, eastern, Local(2020, 3, 8, 2, 0, 0)) ==
            ResultNonExistentLocalTime);
    REQUIRE(IsDstForLocal(is_dst, eastern, Local(2020, 3, 8, 2, 59, 59)) ==
            ResultNonExistentLocalTime);

    REQUIRE(OffsetForLocal(offset, eastern, Local(2020, 3, 8, 1, 59, 59)) == ResultSuccess);
    REQUIRE(offset == -18000);
    REQUIRE(OffsetForLocal(offset, eastern, Local(2020, 3, 8, 3, 0, 0)) == ResultSuccess);
    REQUIRE(offset == -14400);
    REQUIRE(OffsetForLocal(offset, eastern, Local(2020, 11, 1, 2, 0, 0)) == ResultSuccess);
    REQUIRE(offset == -18000);
}

TEST_CASE("LocalTimeResolver: Negative daylight saving", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();
    // Daylight offset below the standard one, as in Irish civil time
    const auto irish = Parse("IST-1GMT0,M10.5.0,M3.5.0/1");

    s32 offset{};
    bool is_dst{};

    // 2021-10-31 01:30 happens twice, the smaller offset is the daylight one here
    REQUIRE(IsDstForLocal(is_dst, irish, Local(2021, 10, 31, 1, 30, 0)) == ResultSuccess);
    REQUIRE(is_dst);
    REQUIRE(OffsetForLocal(offset, irish, Local(2021, 10, 31, 1, 30, 0)) == ResultSuccess);
    REQUIRE(offset == 0);

    // 2021-03-28 01:30 is skipped
    REQUIRE(OffsetForLocal(offset, irish, Local(2021, 3, 28, 1, 30, 0)) ==
            ResultNonExistentLocalTime);

    REQUIRE(OffsetForLocal(offset, irish, Local(2021, 7, 1, 12, 0, 0)) == ResultSuccess);
    REQUIRE(offset == 3600);
    REQUIRE(OffsetForLocal(offset, irish, Local(2021, 1, 1, 12, 0, 0)) == ResultSuccess);
    REQUIRE(offset == 0);
}

TEST_CASE("LocalTimeResolver: Leap second clamping", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();
    const auto eastern = Parse("EST5EDT,M3.2.0,M11.1.0");

    CivilInstant reading = Local(2016, 12, 31, 0, 0, 0);
    reading.seconds_of_day = 86400;
    s32 offset{};
    REQUIRE(OffsetForLocal(offset, eastern, reading) == ResultSuccess);
    REQUIRE(offset == -18000);
}

} // namespace SysVTz
