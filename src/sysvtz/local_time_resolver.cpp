// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <algorithm>

#include "common/logging/log.h"
#include "sysvtz/calendar.h"
#include "sysvtz/errors.h"
#include "sysvtz/local_time_resolver.h"
#include "sysvtz/transition_engine.h"

namespace SysVTz {

Result IsDstForLocal(bool& out_is_dst, const TimeZoneDescriptor& descriptor,
                     const CivilInstant& local) {
    if (!descriptor.dst) {
        out_is_dst = false;
        R_SUCCEED();
    }

    const CivilInstant reading{
        .day_number = local.day_number,
        .seconds_of_day = std::min(local.seconds_of_day, LastSecondOfDay),
    };
    const CivilInstant std_candidate = ShiftCivilInstant(reading, -descriptor.std_offset);
    const CivilInstant dst_candidate = ShiftCivilInstant(reading, -descriptor.dst->offset);

    bool std_candidate_is_dst{};
    bool dst_candidate_is_dst{};
    R_TRY(IsDstForInstant(std_candidate_is_dst, descriptor, std_candidate));
    R_TRY(IsDstForInstant(dst_candidate_is_dst, descriptor, dst_candidate));

    const bool std_valid = !std_candidate_is_dst;
    const bool dst_valid = dst_candidate_is_dst;

    if (std_valid && dst_valid) {
        LOG_TRACE(SysVTz_LocalTime, "{} is ambiguous in {}", reading, descriptor.Name());
        out_is_dst = descriptor.std_offset > descriptor.dst->offset;
        R_SUCCEED();
    }
    if (std_valid || dst_valid) {
        out_is_dst = dst_valid;
        R_SUCCEED();
    }

    LOG_WARNING(SysVTz_LocalTime, "Local time {} does not exist in {}", reading,
                descriptor.Name());
    R_THROW(ResultNonExistentLocalTime);
}

Result OffsetForLocal(s32& out_offset, const TimeZoneDescriptor& descriptor,
                      const CivilInstant& local) {
    bool is_dst{};
    R_TRY(IsDstForLocal(is_dst, descriptor, local));
    out_offset = is_dst ? descriptor.dst->offset : descriptor.std_offset;
    R_SUCCEED();
}

} // namespace SysVTz
