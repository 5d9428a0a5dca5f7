// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <variant>
#include <fmt/format.h>

#include "common/common_types.h"

namespace SysVTz {

/// `Jn`: day 1 to 365 of the year, February 29 is never counted.
struct JulianDay {
    bool operator==(const JulianDay& other) const = default;

    u32 day;
};

/// `n`: day 0 to 365 of the year, February 29 is counted in leap years.
struct ZeroBasedDay {
    bool operator==(const ZeroBasedDay& other) const = default;

    u32 day;
};

/// `Mm.w.d`: weekday `d` (0 for Sunday) of week `w` (1 to 5, 5 for the last) of month `m`.
struct MonthWeekDay {
    bool operator==(const MonthWeekDay& other) const = default;

    u32 month;
    u32 week;
    u32 weekday;
};

using DayRuleSpec = std::variant<JulianDay, ZeroBasedDay, MonthWeekDay>;

constexpr u32 MaxJulianDay = 365;
constexpr u32 MaxZeroBasedDay = 365;
constexpr u32 LastWeekOfMonth = 5;

/// Day of `year` selected by the rule, 1 for January 1.
[[nodiscard]] s32 ResolveDayOfYear(const DayRuleSpec& rule, s64 year);

} // namespace SysVTz

template <>
struct fmt::formatter<SysVTz::DayRuleSpec> : fmt::formatter<fmt::string_view> {
    template <typename FormatContext>
    auto format(const SysVTz::DayRuleSpec& rule, FormatContext& ctx) const {
        if (const auto* julian = std::get_if<SysVTz::JulianDay>(&rule)) {
            return fmt::format_to(ctx.out(), "J{}", julian->day);
        }
        if (const auto* plain = std::get_if<SysVTz::ZeroBasedDay>(&rule)) {
            return fmt::format_to(ctx.out(), "{}", plain->day);
        }
        const auto& mwd = std::get<SysVTz::MonthWeekDay>(rule);
        return fmt::format_to(ctx.out(), "M{}.{}.{}", mwd.month, mwd.week, mwd.weekday);
    }
};
