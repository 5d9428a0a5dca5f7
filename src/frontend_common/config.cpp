// SPDX-FileCopyrightText: 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <system_error>
#include "common/assert.h"
#include "common/logging/log.h"
#include "common/settings.h"
#include "common/settings_common.h"
#include "config.h"

#include <boost/algorithm/string/replace.hpp>

#include "common/string_util.h"

namespace fs = std::filesystem;

std::filesystem::path Config::GetConfigDirectory() {
    if (const char* xdg_config_home = std::getenv("XDG_CONFIG_HOME");
        xdg_config_home != nullptr && xdg_config_home[0] != '\0') {
        return fs::path{xdg_config_home} / "sysvtz";
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && home[0] != '\0') {
        return fs::path{home} / ".config" / "sysvtz";
    }
    return fs::current_path() / "sysvtz";
}

void Config::Initialize(const std::string& config_name) {
    const auto config_file = fmt::format("{}.ini", config_name);
    Initialize(std::make_optional((GetConfigDirectory() / config_file).string()));
}

void Config::Initialize(const std::optional<std::string> config_path) {
    const fs::path default_config_path = GetConfigDirectory() / "config.ini";
    config_loc = config_path.value_or(default_config_path.string());

    std::error_code ec;
    const fs::path parent = fs::path{config_loc}.parent_path();
    if (!parent.empty() && !fs::create_directories(parent, ec) && ec) {
        LOG_ERROR(Config, "Failed to create {}: {}", parent.string(), ec.message());
    }
    SetUpIni();
    Reload();
}

void Config::WriteToIni() const {
    LOG_INFO(Config, "Writing configuration to: {}", config_loc);
    FILE* fp = std::fopen(config_loc.c_str(), "wb");

    if (fp == nullptr) {
        LOG_ERROR(Config, "Config file could not be saved!");
        return;
    }

    CSimpleIniA::FileWriter writer(fp);
    const SI_Error rc = config->Save(writer, false);
    if (rc < 0) {
        LOG_ERROR(Config, "Config file could not be saved!");
    }
    std::fclose(fp);
}

void Config::SetUpIni() {
    config = std::make_unique<CSimpleIniA>();
    config->SetUnicode(true);
    config->SetSpaces(false);

    FILE* fp = std::fopen(config_loc.c_str(), "rb");
    if (fp == nullptr) {
        fp = std::fopen(config_loc.c_str(), "wb");
    }

    if (fp == nullptr) {
        LOG_ERROR(Config, "Config file could not be loaded!");
        return;
    }

    if (SI_Error rc = config->LoadFile(fp); rc < 0) {
        LOG_ERROR(Config, "Config file could not be loaded!");
    }
    std::fclose(fp);
}

void Config::ReadCoreValues() {
    BeginGroup(Settings::TranslateCategory(Settings::Category::Core));

    ReadCategory(Settings::Category::Core);

    EndGroup();
}

void Config::ReadTimeZoneValues() {
    BeginGroup(Settings::TranslateCategory(Settings::Category::TimeZone));

    ReadCategory(Settings::Category::TimeZone);

    // Recipes are written without surrounding whitespace
    Settings::values.default_recipe.SetValue(
        Common::StripSpaces(Settings::values.default_recipe.GetValue()));

    EndGroup();
}

void Config::ReadDebuggingValues() {
    BeginGroup(Settings::TranslateCategory(Settings::Category::Debugging));

    ReadCategory(Settings::Category::Debugging);

    EndGroup();
}

void Config::ReadMiscellaneousValues() {
    BeginGroup(Settings::TranslateCategory(Settings::Category::Miscellaneous));

    ReadCategory(Settings::Category::Miscellaneous);

    EndGroup();
}

void Config::ReadValues() {
    ReadCoreValues();
    ReadTimeZoneValues();
    ReadDebuggingValues();
    ReadMiscellaneousValues();
}

void Config::SaveValues() {
    LOG_DEBUG(Config, "Saving generic configuration values");
    SaveCoreValues();
    SaveTimeZoneValues();
    SaveDebuggingValues();
    SaveMiscellaneousValues();

    WriteToIni();
}

void Config::SaveCoreValues() {
    BeginGroup(Settings::TranslateCategory(Settings::Category::Core));

    WriteCategory(Settings::Category::Core);

    EndGroup();
}

void Config::SaveTimeZoneValues() {
    BeginGroup(Settings::TranslateCategory(Settings::Category::TimeZone));

    WriteCategory(Settings::Category::TimeZone);

    EndGroup();
}

void Config::SaveDebuggingValues() {
    BeginGroup(Settings::TranslateCategory(Settings::Category::Debugging));

    WriteCategory(Settings::Category::Debugging);

    EndGroup();
}

void Config::SaveMiscellaneousValues() {
    BeginGroup(Settings::TranslateCategory(Settings::Category::Miscellaneous));

    WriteCategory(Settings::Category::Miscellaneous);

    EndGroup();
}

bool Config::ReadBooleanSetting(const std::string& key, const std::optional<bool> default_value) {
    std::string full_key = GetFullKey(key);
    if (!default_value.has_value()) {
        return config->GetBoolValue(GetSection().c_str(), full_key.c_str(), false);
    }

    if (config->GetBoolValue(GetSection().c_str(),
                             std::string(full_key).append("\\default").c_str(), false)) {
        return static_cast<bool>(default_value.value());
    } else {
        return config->GetBoolValue(GetSection().c_str(), full_key.c_str(),
                                    static_cast<bool>(default_value.value()));
    }
}

std::string Config::ReadStringSetting(const std::string& key,
                                      const std::optional<std::string> default_value) {
    std::string result;
    std::string full_key = GetFullKey(key);
    if (!default_value.has_value()) {
        result = config->GetValue(GetSection().c_str(), full_key.c_str(), "");
        boost::replace_all(result, "\"", "");
        return result;
    }

    if (config->GetBoolValue(GetSection().c_str(),
                             std::string(full_key).append("\\default").c_str(), true)) {
        result = default_value.value();
    } else {
        result =
            config->GetValue(GetSection().c_str(), full_key.c_str(), default_value.value().c_str());
    }
    boost::replace_all(result, "\"", "");
    return result;
}

bool Config::Exists(const std::string& section, const std::string& key) const {
    const std::string value = config->GetValue(section.c_str(), key.c_str(), "");
    return !value.empty();
}

void Config::WriteBooleanSetting(const std::string& key, const bool& value,
                                 const std::optional<bool>& default_value) {
    std::optional<std::string> string_default = std::nullopt;
    if (default_value.has_value()) {
        string_default = std::make_optional(ToString(default_value.value()));
    }
    WritePreparedSetting(key, AdjustOutputString(ToString(value)), string_default);
}

void Config::WriteStringSetting(const std::string& key, const std::string& value,
                                const std::optional<std::string>& default_value) {
    std::optional<std::string> string_default = std::nullopt;
    if (default_value.has_value()) {
        string_default = std::make_optional(AdjustOutputString(default_value.value()));
    }
    WritePreparedSetting(key, AdjustOutputString(value), string_default);
}

void Config::WritePreparedSetting(const std::string& key, const std::string& adjusted_value,
                                  const std::optional<std::string>& adjusted_default_value) {
    std::string full_key = GetFullKey(key);
    if (adjusted_default_value.has_value()) {
        WriteString(std::string(full_key).append("\\default"),
                    ToString(adjusted_default_value == adjusted_value));
    }
    WriteString(full_key, adjusted_value);
}

void Config::WriteString(const std::string& key, const std::string& value) {
    config->SetValue(GetSection().c_str(), key.c_str(), value.c_str());
}

void Config::Reload() {
    ReadValues();
    // To apply default value changes
    SaveValues();
}

const std::string& Config::GetConfigFilePath() const {
    return config_loc;
}

void Config::ReadCategory(const Settings::Category category) {
    const auto& settings = Settings::values.linkage.by_category[category];
    std::ranges::for_each(settings, [&](const auto& setting) { ReadSettingGeneric(setting); });
}

void Config::WriteCategory(const Settings::Category category) {
    const auto& settings = Settings::values.linkage.by_category[category];
    std::ranges::for_each(settings, [&](const auto& setting) { WriteSettingGeneric(setting); });
}

void Config::ReadSettingGeneric(Settings::BasicSetting* const setting) {
    if (!setting->Save()) {
        return;
    }

    const std::string key = AdjustKey(setting->GetLabel());
    const std::string default_value(setting->DefaultToString());

    const bool is_default =
        ReadBooleanSetting(std::string(key).append("\\default"), std::make_optional(true));
    if (!is_default) {
        const std::string setting_string = ReadStringSetting(key, default_value);
        setting->LoadString(setting_string);
    } else {
        // Empty string resets the Setting to default
        setting->LoadString("");
    }
}

void Config::WriteSettingGeneric(const Settings::BasicSetting* const setting) {
    if (!setting->Save()) {
        return;
    }

    const std::string key = AdjustKey(setting->GetLabel());
    WriteBooleanSetting(std::string(key).append("\\default"),
                        setting->ToString() == setting->DefaultToString());
    WriteStringSetting(key, setting->ToString());
}

void Config::BeginGroup(const std::string& group) {
    key_stack.push_back(AdjustKey(group));
}

void Config::EndGroup() {
    // You can't end a group if you haven't started one yet
    ASSERT(!key_stack.empty());

    key_stack.pop_back();
}

std::string Config::GetSection() {
    if (key_stack.empty()) {
        return std::string{""};
    }

    return key_stack.front();
}

std::string Config::GetGroup() const {
    if (key_stack.size() <= 1) {
        return std::string{""};
    }

    std::string key;
    for (size_t i = 1; i < key_stack.size(); ++i) {
        key.append(key_stack[i]).append("\\");
    }
    return key;
}

std::string Config::AdjustKey(const std::string& key) {
    std::string adjusted_key(key);
    boost::replace_all(adjusted_key, "/", "\\");
    boost::replace_all(adjusted_key, " ", "%20");
    return adjusted_key;
}

std::string Config::AdjustOutputString(const std::string& string) {
    std::string adjusted_string(string);
    boost::replace_all(adjusted_string, "\\", "/");

    // Values with characters that INI readers treat specially are kept in quotes
    for (const auto& special_character : special_characters) {
        if (adjusted_string.find(special_character) != std::string::npos) {
            adjusted_string.insert(0, "\"");
            adjusted_string.append("\"");
            break;
        }
    }
    return adjusted_string;
}

std::string Config::GetFullKey(const std::string& key) {
    return std::string(GetGroup()).append(AdjustKey(key));
}
