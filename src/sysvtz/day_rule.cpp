// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include "common/assert.h"
#include "common/logging/log.h"
#include "sysvtz/calendar.h"
#include "sysvtz/day_rule.h"

namespace SysVTz {
namespace {
/// Julian days keep March 1 at day 60 by shifting everything after February in leap years.
constexpr u32 JulianLeapDayThreshold = 60;

s32 ResolveJulianDay(const JulianDay& rule, s64 year) {
    const auto day = static_cast<s32>(rule.day);
    if (rule.day < JulianLeapDayThreshold) {
        return day;
    }
    return GetYearLengthInDays(year) - DaysPerNormalYear + day;
}

s32 ResolveMonthWeekDay(const MonthWeekDay& rule, s64 year) {
    ASSERT_MSG(rule.month >= 1 && rule.month <= 12, "Invalid month {}", rule.month);
    const auto month = static_cast<s32>(rule.month);
    const s32 month_length = GetMonthLength(year, month);

    s32 day = rule.week == LastWeekOfMonth ? month_length - (DaysPerWeek - 1)
                                           : static_cast<s32>(rule.week - 1) * DaysPerWeek + 1;
    const s32 first_weekday = GetWeekday(year, month, day);
    day += (static_cast<s32>(rule.weekday) - first_weekday + DaysPerWeek) % DaysPerWeek;

    LOG_TRACE(SysVTz_Calendar, "M{}.{}.{} in {} is day {} of the month", rule.month, rule.week,
              rule.weekday, year, day);
    return DateToDayOfYear(year, month, day);
}
} // namespace

s32 ResolveDayOfYear(const DayRuleSpec& rule, s64 year) {
    if (const auto* julian = std::get_if<JulianDay>(&rule)) {
        return ResolveJulianDay(*julian, year);
    }
    if (const auto* plain = std::get_if<ZeroBasedDay>(&rule)) {
        return static_cast<s32>(plain->day) + 1;
    }
    return ResolveMonthWeekDay(std::get<MonthWeekDay>(rule), year);
}

} // namespace SysVTz
