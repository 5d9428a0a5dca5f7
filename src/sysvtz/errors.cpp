// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include "sysvtz/errors.h"

namespace SysVTz {

const char* GetResultDescription(Result result) {
    if (result == ResultSuccess) {
        return "success";
    }
    if (result == ResultInternalError) {
        return "internal error: transition search did not converge";
    }
    if (result == ResultInvalidArgument) {
        return "invalid argument";
    }
    if (result == ResultInvalidCalendarDate) {
        return "invalid calendar date or time of day";
    }
    if (result == ResultInvalidRecipe) {
        return "not a valid SysV-style timezone recipe";
    }
    if (result == ResultMalformedOffset) {
        return "malformed offset";
    }
    if (result == ResultMalformedRule) {
        return "malformed change rule";
    }
    if (result == ResultNoDaylightSaving) {
        return "time zone has no daylight saving time";
    }
    if (result == ResultNonExistentLocalTime) {
        return "non-existent local time due to offset change";
    }
    if (result == ResultNotInitialized) {
        return "time zone has not been initialized";
    }
    return "unknown error";
}

} // namespace SysVTz
