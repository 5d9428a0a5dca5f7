// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "sysvtz/day_rule.h"
#include "sysvtz/result.h"
#include "sysvtz/time_zone_descriptor.h"

namespace SysVTz {

/**
 * Parses a complete System V time zone recipe such as `EST5EDT,M3.2.0,M11.1.0`.
 *
 * @param out_descriptor Receives the parsed zone. Left untouched on failure.
 * @param recipe The recipe, which must match the grammar in its entirety.
 * @param name Display name to use instead of the recipe itself.
 * @returns ResultInvalidRecipe if any part of the recipe is malformed.
 */
Result ParseRecipe(TimeZoneDescriptor& out_descriptor, std::string_view recipe,
                   std::optional<std::string> name = std::nullopt);

/// Parses a single day rule token (`Jn`, `n` or `Mm.w.d`).
Result ParseDayRule(DayRuleSpec& out_rule, std::string_view token);

} // namespace SysVTz
