// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include "sysvtz/result.h"

namespace SysVTz {

constexpr Result ResultInternalError{ErrorModule::Common, 1};
constexpr Result ResultInvalidArgument{ErrorModule::Common, 2};
constexpr Result ResultInvalidCalendarDate{ErrorModule::Calendar, 1};
constexpr Result ResultInvalidRecipe{ErrorModule::Recipe, 1};
constexpr Result ResultMalformedOffset{ErrorModule::Recipe, 2};
constexpr Result ResultMalformedRule{ErrorModule::Recipe, 3};
constexpr Result ResultNoDaylightSaving{ErrorModule::Transition, 1};
constexpr Result ResultNonExistentLocalTime{ErrorModule::LocalTime, 1};
constexpr Result ResultNotInitialized{ErrorModule::TimeZone, 1};

/// Returns a human readable description of a result produced by this library.
[[nodiscard]] const char* GetResultDescription(Result result);

} // namespace SysVTz
