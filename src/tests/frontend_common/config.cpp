// SPDX-FileCopyrightText: 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <catch2/catch_test_macros.hpp>

#include "common/logging/backend.h"
#include "common/settings.h"
#include "frontend_common/config.h"

namespace {
class TestConfig final : public Config {
public:
    explicit TestConfig(const std::string& path) {
        Initialize(std::make_optional(path));
    }

    void ReloadAllValues() override {
        Reload();
    }

    void SaveAllValues() override {
        SaveValues();
    }
};

std::filesystem::path WriteIni(const char* file_name, const char* contents) {
    const auto path = std::filesystem::temp_directory_path() / file_name;
    std::ofstream file{path, std::ios::trunc};
    file << contents;
    return path;
}
} // Anonymous namespace

TEST_CASE("Config: Reads stored values", "[frontend_common]") {
    Common::Log::DisableLoggingInTests();
    Settings::RestoreDefaults();

    const auto path = WriteIni("sysvtz-config-test-read.ini",
                               "[TimeZone]\n"
                               "default_recipe\\default=false\n"
                               "default_recipe=\"  EST5EDT,M3.2.0,M11.1.0 \"\n"
                               "display_name\\default=true\n"
                               "display_name=ignored\n"
                               "[Core]\n"
                               "transition_years\\default=false\n"
                               "transition_years=99\n"
                               "[Miscellaneous]\n"
                               "use_color_console\\default=false\n"
                               "use_color_console=false\n");

    const TestConfig config{path.string()};
    REQUIRE(config.GetConfigFilePath() == path.string());
    REQUIRE(Settings::values.default_recipe.GetValue() == "EST5EDT,M3.2.0,M11.1.0");
    REQUIRE(Settings::values.display_name.GetValue().empty());
    REQUIRE(Settings::values.transition_years.GetValue() == 50);
    REQUIRE(!Settings::values.use_color_console.GetValue());
    REQUIRE(Settings::values.log_filter.GetValue() == "*:Info");

    Settings::RestoreDefaults();
    std::filesystem::remove(path);
}

TEST_CASE("Config: Writes defaults back", "[frontend_common]") {
    Common::Log::DisableLoggingInTests();
    Settings::RestoreDefaults();

    const auto path = WriteIni("sysvtz-config-test-write.ini", "");
    {
        const TestConfig config{path.string()};
        REQUIRE(config.Exists("TimeZone", "default_recipe"));
        REQUIRE(config.Exists("TimeZone", "default_recipe\\default"));
        REQUIRE(config.Exists("Core", "transition_years"));
        REQUIRE(config.Exists("Debugging", "use_debug_asserts"));
        REQUIRE(config.Exists("Miscellaneous", "log_filter"));
        REQUIRE(!config.Exists("TimeZone", "log_filter"));
    }

    std::ifstream file{path};
    const std::string contents{std::istreambuf_iterator<char>{file},
                               std::istreambuf_iterator<char>{}};
    REQUIRE(contents.find("[TimeZone]") != std::string::npos);
    REQUIRE(contents.find("default_recipe=UTC0") != std::string::npos);
    REQUIRE(contents.find("log_filter=\"*:Info\"") != std::string::npos);

    std::filesystem::remove(path);
}
