// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <concepts>
#include <type_traits>
#include <fmt/format.h>

#include "common/common_types.h"

namespace SysVTz {

constexpr s32 SecondsPerMinute = 60;
constexpr s32 SecondsPerHour = 60 * SecondsPerMinute;
constexpr s32 SecondsPerDay = 24 * SecondsPerHour;
constexpr u32 LastSecondOfDay = SecondsPerDay - 1;
constexpr s32 DaysPerWeek = 7;
constexpr s32 DaysPerNormalYear = 365;
constexpr s32 DaysPerLeapYear = 366;
constexpr s32 MonthsPerYear = 12;

/// A point on a civil time scale: a day number (days since 1970-01-01 in the proleptic
/// Gregorian calendar) and the seconds elapsed since midnight of that day.
struct CivilInstant {
    bool operator==(const CivilInstant& other) const = default;

    s64 day_number;
    u32 seconds_of_day;
};
static_assert(std::is_trivial_v<CivilInstant>);

struct CivilDate {
    bool operator==(const CivilDate& other) const = default;

    s64 year;
    s32 month;
    s32 day;
};

struct CalendarTime {
    bool operator==(const CalendarTime& other) const = default;

    s64 year;
    s8 month;
    s8 day;
    s8 hour;
    s8 minute;
    s8 second;
};

/**
 * A value that can report the instant it represents on the UTC time scale as well as the
 * reading of its local wall clock. The time zone queries only ever look at these two pairs.
 */
template <typename T>
concept CivilInstantProvider = requires(const T& t) {
    { t.GetUtcCivilInstant() } -> std::convertible_to<CivilInstant>;
    { t.GetLocalCivilInstant() } -> std::convertible_to<CivilInstant>;
};

} // namespace SysVTz

template <>
struct fmt::formatter<SysVTz::CalendarTime> : fmt::formatter<fmt::string_view> {
    template <typename FormatContext>
    auto format(const SysVTz::CalendarTime& time, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}", time.year,
                              time.month, time.day, time.hour, time.minute, time.second);
    }
};
