// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "common/common_types.h"
#include "sysvtz/day_rule.h"

namespace SysVTz {

/// Change time used when a rule does not state one, 02:00:00 local time.
constexpr s32 DefaultChangeTimeOfDay = 2 * 3600;
/// Daylight-saving offset used when a recipe names a DST abbreviation without an offset.
constexpr s32 DefaultDaylightSavingShift = 3600;

/// Rules applied when a recipe enables daylight saving without stating when it changes.
constexpr MonthWeekDay DefaultStartRule{.month = 4, .week = 5, .weekday = 0};
constexpr MonthWeekDay DefaultEndRule{.month = 10, .week = 5, .weekday = 0};

struct ChangeRule {
    bool operator==(const ChangeRule& other) const = default;

    DayRuleSpec day_rule;
    /// Seconds after UT midnight of the selected day at which the change happens. May fall
    /// outside 0 to 86399, the reference offset is already folded in.
    s32 trigger_seconds_of_day;
};

struct DaylightSavingInfo {
    bool operator==(const DaylightSavingInfo& other) const = default;

    std::string abbreviation;
    s32 offset;
    ChangeRule start_rule;
    ChangeRule end_rule;
};

/// Parsed form of a System V time zone recipe. Built once and never mutated afterwards.
struct TimeZoneDescriptor {
    bool operator==(const TimeZoneDescriptor& other) const = default;

    [[nodiscard]] std::string_view Name() const {
        return display_name;
    }

    [[nodiscard]] bool HasDstChanges() const {
        return dst.has_value();
    }

    std::string raw_recipe;
    std::string display_name;
    std::string std_abbreviation;
    s32 std_offset{};
    std::optional<DaylightSavingInfo> dst;
};

/// Builds a change rule from its day rule, local clock time and the offset in force before it.
[[nodiscard]] constexpr ChangeRule MakeChangeRule(const DayRuleSpec& day_rule,
                                                  s32 clock_seconds, s32 reference_offset) {
    return {
        .day_rule = day_rule,
        .trigger_seconds_of_day = -reference_offset + clock_seconds,
    };
}

} // namespace SysVTz
