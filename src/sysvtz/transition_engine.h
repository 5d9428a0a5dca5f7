// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <string>

#include "common/common_types.h"
#include "sysvtz/common.h"
#include "sysvtz/result.h"
#include "sysvtz/time_zone_descriptor.h"

namespace SysVTz {

/// Upper bound on the number of years the backward transition search may visit.
constexpr u32 MaxTransitionSearchYears = 400;

/// UTC instants at which daylight saving starts and ends within one Gregorian year.
struct YearTransitions {
    bool operator==(const YearTransitions& other) const = default;

    CivilInstant dst_start;
    CivilInstant dst_end;
};

/**
 * Determines whether daylight saving is in effect at a UTC instant. Seconds of day past 86399
 * are treated as 86399.
 *
 * @returns ResultInternalError if a transition could not be located within the search bound.
 */
Result IsDstForInstant(bool& out_is_dst, const TimeZoneDescriptor& descriptor,
                       const CivilInstant& utc);

Result OffsetForInstant(s32& out_offset, const TimeZoneDescriptor& descriptor,
                        const CivilInstant& utc);

Result AbbreviationForInstant(std::string& out_abbreviation, const TimeZoneDescriptor& descriptor,
                              const CivilInstant& utc);

/// @returns ResultNoDaylightSaving for fixed-offset zones.
Result GetTransitionsForYear(YearTransitions& out_transitions, const TimeZoneDescriptor& descriptor,
                             s64 year);

} // namespace SysVTz
