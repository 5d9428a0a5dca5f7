// SPDX-FileCopyrightText: Copyright 2020 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <array>
#include <chrono>
#include <string>
#include <string_view>

namespace Common::TimeZone {

struct ExampleRecipe {
    std::string_view recipe;
    std::string_view description;
};

/// Recipes with a short description of the civil time they describe
[[nodiscard]] const std::array<ExampleRecipe, 6>& GetExampleRecipes();

/// Gets the default time zone recipe, i.e. "UTC0"
[[nodiscard]] std::string GetDefaultTimeZone();

/// Gets the offset of the current timezone (from UTC), in seconds
[[nodiscard]] std::chrono::seconds GetCurrentOffsetSeconds();

/// Builds a fixed offset recipe matching the current offset of the system time zone
[[nodiscard]] std::string FindSystemTimeZone();

} // namespace Common::TimeZone
