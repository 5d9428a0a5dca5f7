// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <array>
#include <fmt/format.h>

#include "common/common_types.h"
#include "sysvtz/common.h"
#include "sysvtz/result.h"

namespace SysVTz {

template <typename T>
constexpr bool IsLeapYear(T year) {
    return ((year) % 4) == 0 && (((year) % 100) != 0 || ((year) % 400) == 0);
}

template <typename T>
constexpr s32 GetYearLengthInDays(T year) {
    return IsLeapYear(year) ? DaysPerLeapYear : DaysPerNormalYear;
}

/// Number of days in `month` (1 to 12) of `year`.
constexpr s32 GetMonthLength(s64 year, s32 month) {
    constexpr std::array<s32, 12> month_lengths{31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeapYear(year)) {
        return 29;
    }
    return month_lengths[static_cast<std::size_t>(month - 1)];
}

struct YearDay {
    bool operator==(const YearDay& other) const = default;

    s64 year;
    s32 day_of_year; ///< 1 for January 1
};

[[nodiscard]] s64 CivilDateToDayNumber(const CivilDate& date);
[[nodiscard]] CivilDate DayNumberToCivilDate(s64 day_number);
[[nodiscard]] YearDay DayNumberToYearDay(s64 day_number);

/// Day of the year of the given date, 1 for January 1.
[[nodiscard]] s32 DateToDayOfYear(s64 year, s32 month, s32 day);

/// Day of the week of the given date, 0 for Sunday through 6 for Saturday.
[[nodiscard]] s32 GetWeekday(s64 year, s32 month, s32 day);
[[nodiscard]] s32 GetWeekdayOfDayNumber(s64 day_number);

[[nodiscard]] CivilInstant CivilInstantFromUnixSeconds(s64 unix_seconds);
[[nodiscard]] s64 CivilInstantToUnixSeconds(const CivilInstant& instant);

/// Moves an instant by a number of seconds, carrying whole days into the day number.
[[nodiscard]] CivilInstant ShiftCivilInstant(const CivilInstant& instant, s64 seconds);

/**
 * Converts a calendar reading to a civil instant. A second of 60 is accepted at 23:59 only and
 * is represented as seconds-of-day 86400.
 */
Result ToCivilInstant(CivilInstant& out_instant, const CalendarTime& calendar);
[[nodiscard]] CalendarTime ToCalendarTime(const CivilInstant& instant);

} // namespace SysVTz

template <>
struct fmt::formatter<SysVTz::CivilInstant> : fmt::formatter<fmt::string_view> {
    template <typename FormatContext>
    auto format(const SysVTz::CivilInstant& instant, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", SysVTz::ToCalendarTime(instant));
    }
};
