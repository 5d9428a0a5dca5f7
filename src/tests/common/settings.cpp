// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <string>
#include <catch2/catch_test_macros.hpp>

#include "common/logging/backend.h"
#include "common/settings.h"

namespace Settings {

TEST_CASE("Settings: Defaults", "[common]") {
    RestoreDefaults();

    REQUIRE(values.default_recipe.GetValue() == "UTC0");
    REQUIRE(values.display_name.GetValue().empty());
    REQUIRE(values.transition_years.GetValue() == 1);
    REQUIRE(values.log_filter.GetValue() == "*:Info");
    REQUIRE(values.log_file.GetValue().empty());
    REQUIRE(values.use_color_console.GetValue());
    REQUIRE(!values.use_debug_asserts.GetValue());
}

TEST_CASE("Settings: Linkage", "[common]") {
    REQUIRE(values.linkage.by_key.contains("default_recipe"));
    REQUIRE(values.linkage.by_key.contains("log_filter"));
    REQUIRE(values.linkage.by_key.size() == 7);

    const auto& time_zone = values.linkage.by_category[Category::TimeZone];
    REQUIRE(time_zone.size() == 2);
    REQUIRE(time_zone[0]->GetLabel() == "default_recipe");
    REQUIRE(time_zone[0]->GetCategory() == Category::TimeZone);

    REQUIRE(std::string{TranslateCategory(Category::TimeZone)} == "TimeZone");
    REQUIRE(std::string{TranslateCategory(Category::Debugging)} == "Debugging");
}

TEST_CASE("Settings: Ranged values", "[common]") {
    RestoreDefaults();

    auto& years = values.transition_years;
    REQUIRE(years.Ranged());
    REQUIRE(years.MinVal() == "1");
    REQUIRE(years.MaxVal() == "50");

    years.SetValue(100);
    REQUIRE(years.GetValue() == 50);
    years.SetValue(0);
    REQUIRE(years.GetValue() == 1);

    years.LoadString("12");
    REQUIRE(years.GetValue() == 12);
    REQUIRE(years.ToString() == "12");
    years.LoadString("twelve");
    REQUIRE(years.GetValue() == 1);
    years.LoadString("");
    REQUIRE(years.GetValue() == 1);
}

TEST_CASE("Settings: String conversion", "[common]") {
    RestoreDefaults();

    values.use_color_console.LoadString("false");
    REQUIRE(!values.use_color_console.GetValue());
    REQUIRE(values.use_color_console.ToString() == "false");
    REQUIRE(values.use_color_console.DefaultToString() == "true");

    values.default_recipe.LoadString("EST5EDT,M3.2.0,M11.1.0");
    REQUIRE(values.default_recipe.GetValue() == "EST5EDT,M3.2.0,M11.1.0");

    RestoreDefaults();
    REQUIRE(values.use_color_console.GetValue());
    REQUIRE(values.default_recipe.GetValue() == "UTC0");
}

} // namespace Settings
