// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <string>
#include <catch2/catch_test_macros.hpp>

#include "common/logging/backend.h"
#include "common/time_zone.h"
#include "sysvtz/errors.h"
#include "sysvtz/recipe_parser.h"

namespace SysVTz {

TEST_CASE("RecipeParser: Fixed offset", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();

    TimeZoneDescriptor descriptor{};
    REQUIRE(ParseRecipe(descriptor, "EST5") == ResultSuccess);
    REQUIRE(descriptor.Name() == "EST5");
    REQUIRE(descriptor.raw_recipe == "EST5");
    REQUIRE(descriptor.std_abbreviation == "EST");
    REQUIRE(descriptor.std_offset == -18000);
    REQUIRE(!descriptor.HasDstChanges());

    REQUIRE(ParseRecipe(descriptor, "MUT-4") == ResultSuccess);
    REQUIRE(descriptor.std_offset == 14400);

    REQUIRE(ParseRecipe(descriptor, "<+0530>-5:30") == ResultSuccess);
    REQUIRE(descriptor.std_abbreviation == "+0530");
    REQUIRE(descriptor.std_offset == 19800);

    REQUIRE(ParseRecipe(descriptor, "<UTC>0") == ResultSuccess);
    REQUIRE(descriptor.std_abbreviation == "UTC");
    REQUIRE(descriptor.std_offset == 0);
}

TEST_CASE("RecipeParser: Daylight saving", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();

    TimeZoneDescriptor descriptor{};
    REQUIRE(ParseRecipe(descriptor, "EST5EDT,M3.2.0,M11.1.0") == ResultSuccess);
    REQUIRE(descriptor.Name() == "EST5EDT,M3.2.0,M11.1.0");
    REQUIRE(descriptor.HasDstChanges());
    REQUIRE(descriptor.dst->abbreviation == "EDT");
    REQUIRE(descriptor.dst->offset == -14400);
    REQUIRE(descriptor.dst->start_rule.day_rule == DayRuleSpec{MonthWeekDay{3, 2, 0}});
    REQUIRE(descriptor.dst->start_rule.trigger_seconds_of_day == 18000 + 7200);
    REQUIRE(descriptor.dst->end_rule.day_rule == DayRuleSpec{MonthWeekDay{11, 1, 0}});
    REQUIRE(descriptor.dst->end_rule.trigger_seconds_of_day == 14400 + 7200);

    REQUIRE(ParseRecipe(descriptor, "NST3:30NDT,M3.2.0/0:01,M11.1.0/0:01") == ResultSuccess);
    REQUIRE(descriptor.std_offset == -12600);
    REQUIRE(descriptor.dst->offset == -9000);
    REQUIRE(descriptor.dst->start_rule.trigger_seconds_of_day == 12600 + 60);
    REQUIRE(descriptor.dst->end_rule.trigger_seconds_of_day == 9000 + 60);

    REQUIRE(ParseRecipe(descriptor, "EST-10EST,M10.5.0,M3.5.0/3") == ResultSuccess);
    REQUIRE(descriptor.std_abbreviation == "EST");
    REQUIRE(descriptor.dst->abbreviation == "EST");
    REQUIRE(descriptor.dst->offset == 39600);
    REQUIRE(descriptor.dst->end_rule.trigger_seconds_of_day == -39600 + 10800);

    REQUIRE(ParseRecipe(descriptor, "AAA3BBB2,J60/1:30:15,300") == ResultSuccess);
    REQUIRE(descriptor.dst->offset == -7200);
    REQUIRE(descriptor.dst->start_rule.day_rule == DayRuleSpec{JulianDay{60}});
    REQUIRE(descriptor.dst->start_rule.trigger_seconds_of_day == 10800 + 5415);
    REQUIRE(descriptor.dst->end_rule.day_rule == DayRuleSpec{ZeroBasedDay{300}});
}

TEST_CASE("RecipeParser: Legacy default rules", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();

    TimeZoneDescriptor descriptor{};
    REQUIRE(ParseRecipe(descriptor, "EST5EDT") == ResultSuccess);
    REQUIRE(descriptor.dst->offset == -14400);
    REQUIRE(descriptor.dst->start_rule.day_rule == DayRuleSpec{DefaultStartRule});
    REQUIRE(descriptor.dst->end_rule.day_rule == DayRuleSpec{DefaultEndRule});
    REQUIRE(descriptor.dst->start_rule.trigger_seconds_of_day == 18000 + 7200);
    REQUIRE(descriptor.dst->end_rule.trigger_seconds_of_day == 14400 + 7200);

    REQUIRE(ParseRecipe(descriptor, "<-03>3<-02>") == ResultSuccess);
    REQUIRE(descriptor.dst->abbreviation == "-02");
    REQUIRE(descriptor.dst->offset == -7200);
}

TEST_CASE("RecipeParser: Leading zeros in day rules", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();

    TimeZoneDescriptor descriptor{};
    REQUIRE(ParseRecipe(descriptor, "EST5EDT,M03.02.00,M011.001.0") == ResultSuccess);
    REQUIRE(descriptor.dst->start_rule.day_rule == DayRuleSpec{MonthWeekDay{3, 2, 0}});
    REQUIRE(descriptor.dst->end_rule.day_rule == DayRuleSpec{MonthWeekDay{11, 1, 0}});

    REQUIRE(ParseRecipe(descriptor, "EST5EDT,J0060,00059") == ResultSuccess);
    REQUIRE(descriptor.dst->start_rule.day_rule == DayRuleSpec{JulianDay{60}});
    REQUIRE(descriptor.dst->end_rule.day_rule == DayRuleSpec{ZeroBasedDay{59}});
}

TEST_CASE("RecipeParser: Name override", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();

    TimeZoneDescriptor descriptor{};
    REQUIRE(ParseRecipe(descriptor, "GMT0BST,M3.5.0/1,M10.5.0", "Europe/London") ==
            ResultSuccess);
    REQUIRE(descriptor.Name() == "Europe/London");
    REQUIRE(descriptor.raw_recipe == "GMT0BST,M3.5.0/1,M10.5.0");
}

TEST_CASE("RecipeParser: Invalid recipes", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();

    TimeZoneDescriptor descriptor{};
    REQUIRE(ParseRecipe(descriptor, "CET-1") == ResultSuccess);

    for (const char* recipe : {
             "",
             "EST",
             "ES5",
             "5EST",
             "EST25",
             "EST5:3",
             "<ES>5",
             "<EST5",
             "<E_T>5",
             "EST5ED",
             "EST5EDT,",
             "EST5EDT,M3.2.0",
             "EST5EDT,M3.2.0,",
             "EST5EDT,M3.2.0,M11.1.0,",
             "EST5EDT,M3.2.0,M11.1.0x",
             "EST5EDT,M13.2.0,M11.1.0",
             "EST5EDT,M3.6.0,M11.1.0",
             "EST5EDT,M3.2.7,M11.1.0",
             "EST5EDT,M3.0.0,M11.1.0",
             "EST5EDT,J0,M11.1.0",
             "EST5EDT,J366,M11.1.0",
             "EST5EDT,366,M11.1.0",
             "EST5EDT,M3.2.0/24,M11.1.0",
             "EST5EDT,M3.2.0/-1,M11.1.0",
             "EST5EDT,M3.2.0/,M11.1.0",
             "EST5EDT4x",
             "EST5 EDT",
             " EST5",
         }) {
        INFO(recipe);
        REQUIRE(ParseRecipe(descriptor, recipe) == ResultInvalidRecipe);
    }

    // A failed parse leaves the previous result in place
    REQUIRE(descriptor.Name() == "CET-1");
}

TEST_CASE("RecipeParser: Example recipes", "[sysvtz]") {
    Common::Log::DisableLoggingInTests();

    for (const auto& example : Common::TimeZone::GetExampleRecipes()) {
        INFO(example.recipe);
        TimeZoneDescriptor descriptor{};
        REQUIRE(ParseRecipe(descriptor, example.recipe) == ResultSuccess);
        REQUIRE(descriptor.Name() == example.recipe);
    }

    TimeZoneDescriptor descriptor{};
    REQUIRE(ParseRecipe(descriptor, Common::TimeZone::FindSystemTimeZone()) == ResultSuccess);
}

TEST_CASE("RecipeParser: Day rule tokens", "[sysvtz]") {
    DayRuleSpec rule{};
    REQUIRE(ParseDayRule(rule, "J1") == ResultSuccess);
    REQUIRE(rule == DayRuleSpec{JulianDay{1}});
    REQUIRE(ParseDayRule(rule, "0") == ResultSuccess);
    REQUIRE(rule == DayRuleSpec{ZeroBasedDay{0}});
    REQUIRE(ParseDayRule(rule, "365") == ResultSuccess);
    REQUIRE(rule == DayRuleSpec{ZeroBasedDay{365}});
    REQUIRE(ParseDayRule(rule, "M12.5.6") == ResultSuccess);
    REQUIRE(rule == DayRuleSpec{MonthWeekDay{12, 5, 6}});

    REQUIRE(ParseDayRule(rule, "J") == ResultMalformedRule);
    REQUIRE(ParseDayRule(rule, "M1.1") == ResultMalformedRule);
    REQUIRE(ParseDayRule(rule, "M1..1") == ResultMalformedRule);
    REQUIRE(ParseDayRule(rule, "x") == ResultMalformedRule);
    REQUIRE(ParseDayRule(rule, "99999999999999999999") == ResultMalformedRule);
}

} // namespace SysVTz
