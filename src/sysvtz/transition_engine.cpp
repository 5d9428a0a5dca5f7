// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <algorithm>

#include "common/logging/log.h"
#include "sysvtz/calendar.h"
#include "sysvtz/errors.h"
#include "sysvtz/transition_engine.h"

namespace SysVTz {
namespace {
/**
 * Finds the most recent firing of `rule` at or before `second_of_year`, counted from the start
 * of `year` with January 1 as day 1. The search starts in the following year since a rule whose
 * trigger is negative can fire late on December 31 of the year before its nominal day.
 */
Result FindLatestTransition(s64& out_second, const ChangeRule& rule, s64 year,
                            s64 second_of_year) {
    s64 candidate_year = year + 1;
    s64 day_offset = GetYearLengthInDays(year);

    for (u32 iteration = 0; iteration < MaxTransitionSearchYears; iteration++) {
        const s64 change_second =
            (day_offset + ResolveDayOfYear(rule.day_rule, candidate_year)) * SecondsPerDay +
            rule.trigger_seconds_of_day;
        if (change_second <= second_of_year) {
            out_second = change_second;
            R_SUCCEED();
        }
        day_offset -= GetYearLengthInDays(--candidate_year);
    }

    LOG_ERROR(SysVTz_Transition, "No firing of {} found within {} years before {}",
              rule.day_rule, MaxTransitionSearchYears, year);
    R_THROW(ResultInternalError);
}
} // namespace

Result IsDstForInstant(bool& out_is_dst, const TimeZoneDescriptor& descriptor,
                       const CivilInstant& utc) {
    if (!descriptor.dst) {
        out_is_dst = false;
        R_SUCCEED();
    }

    const auto seconds_of_day = std::min(utc.seconds_of_day, LastSecondOfDay);
    const YearDay year_day = DayNumberToYearDay(utc.day_number);
    const s64 second_of_year =
        static_cast<s64>(year_day.day_of_year) * SecondsPerDay + seconds_of_day;

    s64 latest_end{};
    s64 latest_start{};
    R_TRY(FindLatestTransition(latest_end, descriptor.dst->end_rule, year_day.year,
                               second_of_year));
    R_TRY(FindLatestTransition(latest_start, descriptor.dst->start_rule, year_day.year,
                               second_of_year));

    out_is_dst = latest_start > latest_end;
    R_SUCCEED();
}

Result OffsetForInstant(s32& out_offset, const TimeZoneDescriptor& descriptor,
                        const CivilInstant& utc) {
    bool is_dst{};
    R_TRY(IsDstForInstant(is_dst, descriptor, utc));
    out_offset = is_dst ? descriptor.dst->offset : descriptor.std_offset;
    R_SUCCEED();
}

Result AbbreviationForInstant(std::string& out_abbreviation, const TimeZoneDescriptor& descriptor,
                              const CivilInstant& utc) {
    bool is_dst{};
    R_TRY(IsDstForInstant(is_dst, descriptor, utc));
    out_abbreviation = is_dst ? descriptor.dst->abbreviation : descriptor.std_abbreviation;
    R_SUCCEED();
}

Result GetTransitionsForYear(YearTransitions& out_transitions, const TimeZoneDescriptor& descriptor,
                             s64 year) {
    R_UNLESS(descriptor.dst.has_value(), ResultNoDaylightSaving);

    const s64 new_year = CivilDateToDayNumber({.year = year, .month = 1, .day = 1});
    const auto fire = [&](const ChangeRule& rule) {
        const CivilInstant midnight{
            .day_number = new_year + ResolveDayOfYear(rule.day_rule, year) - 1,
            .seconds_of_day = 0,
        };
        return ShiftCivilInstant(midnight, rule.trigger_seconds_of_day);
    };

    out_transitions = {
        .dst_start = fire(descriptor.dst->start_rule),
        .dst_end = fire(descriptor.dst->end_rule),
    };
    LOG_TRACE(SysVTz_Transition, "{} in {}: start {}, end {}", descriptor.Name(), year,
              out_transitions.dst_start, out_transitions.dst_end);
    R_SUCCEED();
}

} // namespace SysVTz
