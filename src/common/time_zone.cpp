// SPDX-FileCopyrightText: Copyright 2020 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <string>
#include <fmt/format.h>

#include "common/common_types.h"
#include "common/logging/log.h"
#include "common/time_zone.h"

namespace Common::TimeZone {

constexpr std::array<ExampleRecipe, 6> example_recipes{{
    {"UTC0", "Universal Time, no DST"},
    {"MUT-4", "Mauritius time, since 1907: 4 hours ahead of UT all year"},
    {"EST5EDT,M3.2.0,M11.1.0", "US Eastern time from 2007 onwards"},
    {"NST3:30NDT,M3.2.0/0:01,M11.1.0/0:01", "Newfoundland time from 2007 onwards"},
    {"GMT0BST,M3.5.0/1,M10.5.0", "UK civil time from 1996 onwards"},
    {"EST-10EST,M10.5.0,M3.5.0/3", "Australian Eastern time from 2007 onwards"},
}};

const std::array<ExampleRecipe, 6>& GetExampleRecipes() {
    return example_recipes;
}

std::string GetDefaultTimeZone() {
    return "UTC0";
}

// Results are not comparable to seconds since Epoch
static std::time_t TmSpecToSeconds(const struct std::tm& spec) {
    const int year = spec.tm_year - 1; // Years up to now
    const int leap_years = year / 4 - year / 100;
    std::time_t cumulative = spec.tm_year;
    cumulative = cumulative * 365 + leap_years + spec.tm_yday; // Years to days
    cumulative = cumulative * 24 + spec.tm_hour;               // Days to hours
    cumulative = cumulative * 60 + spec.tm_min;                // Hours to minutes
    cumulative = cumulative * 60 + spec.tm_sec;                // Minutes to seconds
    return cumulative;
}

std::chrono::seconds GetCurrentOffsetSeconds() {
    const std::time_t t{std::time(nullptr)};
    const std::tm local{*std::localtime(&t)};
    const std::tm gmt{*std::gmtime(&t)};

    // gmt_seconds is a different offset than time(nullptr)
    const auto gmt_seconds = TmSpecToSeconds(gmt);
    const auto local_seconds = TmSpecToSeconds(local);
    const auto seconds_offset = local_seconds - gmt_seconds;

    return std::chrono::seconds{seconds_offset};
}

std::string FindSystemTimeZone() {
    const s64 seconds = static_cast<s64>(GetCurrentOffsetSeconds().count());
    if (seconds == 0) {
        return GetDefaultTimeZone();
    }

    const s64 magnitude = std::abs(seconds);
    const s64 hours = magnitude / 3600;
    const s64 minutes = (magnitude / 60) % 60;
    const s64 secs = magnitude % 60;

    // Recipes count offsets westwards, so the sign is purposefully reversed for the offset while
    // the bracketed abbreviation keeps the conventional eastward sign.
    const char east_sign = seconds > 0 ? '+' : '-';
    const char recipe_sign = seconds > 0 ? '-' : '+';

    std::string abbreviation = fmt::format("{}{:02d}", east_sign, hours);
    std::string offset = fmt::format("{}{}", recipe_sign, hours);
    if (minutes != 0 || secs != 0) {
        abbreviation += fmt::format("{:02d}", minutes);
        offset += fmt::format(":{:02d}", minutes);
    }
    if (secs != 0) {
        abbreviation += fmt::format("{:02d}", secs);
        offset += fmt::format(":{:02d}", secs);
    }

    const auto recipe = fmt::format("<{}>{}", abbreviation, offset);
    LOG_DEBUG(Common, "System offset {}s maps to recipe {}", seconds, recipe);
    return recipe;
}

} // namespace Common::TimeZone
