// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include "common/common_types.h"
#include "sysvtz/common.h"
#include "sysvtz/result.h"
#include "sysvtz/time_zone_descriptor.h"

namespace SysVTz {

/**
 * Decides whether a local wall clock reading belongs to daylight saving time.
 *
 * A reading that occurs twice around a change resolves to the numerically smaller offset.
 *
 * @returns ResultNonExistentLocalTime if the reading falls into the gap skipped by a change.
 */
Result IsDstForLocal(bool& out_is_dst, const TimeZoneDescriptor& descriptor,
                     const CivilInstant& local);

/// Offset in effect at a local wall clock reading, see IsDstForLocal.
Result OffsetForLocal(s32& out_offset, const TimeZoneDescriptor& descriptor,
                      const CivilInstant& local);

} // namespace SysVTz
