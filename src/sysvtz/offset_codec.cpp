// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <cstdlib>
#include <fmt/format.h>

#include "sysvtz/common.h"
#include "sysvtz/errors.h"
#include "sysvtz/offset_codec.h"

namespace SysVTz {
namespace {
constexpr bool IsDigit(char value) {
    return value >= '0' && value <= '9';
}

/// Consumes a run of `min_digits` to `max_digits` decimal digits and checks it against `max`.
constexpr bool GetField(std::string_view token, std::size_t& position, s32& value,
                        std::size_t min_digits, std::size_t max_digits, s32 max) {
    value = 0;
    std::size_t digits{};
    while (position < token.size() && IsDigit(token[position])) {
        if (++digits > max_digits) {
            return false;
        }
        value = value * 10 + (token[position] - '0');
        position++;
    }
    return digits >= min_digits && value <= max;
}

/// Parses `h[h][:mm[:ss]]` starting at `position` and requires it to end the token.
constexpr bool GetClockSeconds(std::string_view token, std::size_t position, s32 max_hours,
                               s32& seconds) {
    s32 hours{};
    s32 minutes{};
    s32 secs{};
    if (!GetField(token, position, hours, 1, 2, max_hours)) {
        return false;
    }
    if (position < token.size() && token[position] == ':') {
        if (!GetField(token, ++position, minutes, 2, 2, 59)) {
            return false;
        }
        if (position < token.size() && token[position] == ':') {
            if (!GetField(token, ++position, secs, 2, 2, 59)) {
                return false;
            }
        }
    }
    if (position != token.size()) {
        return false;
    }
    seconds = hours * SecondsPerHour + minutes * SecondsPerMinute + secs;
    return true;
}
} // namespace

Result ParseOffset(s32& out_seconds, std::string_view token) {
    std::size_t position{};
    bool east_of_ut{};
    if (!token.empty() && (token[0] == '+' || token[0] == '-')) {
        east_of_ut = token[0] == '-';
        position++;
    }

    s32 magnitude{};
    R_UNLESS(GetClockSeconds(token, position, 24, magnitude), ResultMalformedOffset);
    R_UNLESS(magnitude <= MaxOffsetMagnitude, ResultMalformedOffset);

    // Integers carry no negative zero, so "-0" and "+0" both come out as 0.
    out_seconds = east_of_ut ? magnitude : -magnitude;
    R_SUCCEED();
}

Result ParseTimeOfDay(s32& out_seconds, std::string_view token) {
    s32 seconds{};
    R_UNLESS(GetClockSeconds(token, 0, 23, seconds), ResultMalformedOffset);
    out_seconds = seconds;
    R_SUCCEED();
}

std::string FormatOffset(s32 seconds) {
    const char sign = seconds < 0 ? '-' : '+';
    const s32 magnitude = std::abs(seconds);
    const s32 hours = magnitude / SecondsPerHour;
    const s32 minutes = (magnitude / SecondsPerMinute) % 60;
    const s32 secs = magnitude % SecondsPerMinute;
    if (secs != 0) {
        return fmt::format("{}{:02d}:{:02d}:{:02d}", sign, hours, minutes, secs);
    }
    return fmt::format("{}{:02d}:{:02d}", sign, hours, minutes);
}

} // namespace SysVTz
