// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <string>
#include <string_view>

#include "common/common_types.h"
#include "sysvtz/result.h"

namespace SysVTz {

/// Largest offset magnitude a recipe can express, 24:59:59.
constexpr s32 MaxOffsetMagnitude = 24 * 3600 + 59 * 60 + 59;

/**
 * Parses a recipe offset of the form `[+|-]h[h][:mm[:ss]]` into seconds east of UT.
 *
 * Recipes count offsets westwards: a missing or `+` sign yields a negative offset and a `-` sign
 * a positive one.
 *
 * @returns ResultMalformedOffset if the token is not an offset.
 */
Result ParseOffset(s32& out_seconds, std::string_view token);

/// Parses an unsigned change time `h[h][:mm[:ss]]`, hours 0 to 23, into seconds after midnight.
Result ParseTimeOfDay(s32& out_seconds, std::string_view token);

/// Formats seconds east of UT as `+hh:mm`, or `+hh:mm:ss` when there are leftover seconds.
[[nodiscard]] std::string FormatOffset(s32 seconds);

} // namespace SysVTz
