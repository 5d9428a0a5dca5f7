// SPDX-FileCopyrightText: Copyright 2021 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <string>
#include <string_view>

#include <fmt/format.h>

#include "common/logging/log.h"
#include "common/settings.h"

namespace Settings {

// Clang 14 and earlier have errors when explicitly instantiating these classes
#ifndef CANNOT_EXPLICITLY_INSTANTIATE
#define SETTING(TYPE, RANGED) template class Setting<TYPE, RANGED>

SETTING(bool, false);
SETTING(s32, true);
SETTING(std::string, false);

#undef SETTING
#endif

Values values;

void LogSettings() {
    const auto log_setting = [](std::string_view name, const auto& value) {
        LOG_INFO(Settings, "{}: {}", name, value);
    };

    LOG_INFO(Settings, "sysvtz Configuration:");
    for (auto& [category, settings] : values.linkage.by_category) {
        for (const auto& setting : settings) {
            const auto name = fmt::format("{}.{}", TranslateCategory(category),
                                          setting->GetLabel());
            log_setting(name, setting->ToString());
        }
    }
}

void RestoreDefaults() {
    for (auto& [key, setting] : values.linkage.by_key) {
        // An empty string resets the Setting to its default
        setting->LoadString("");
    }
}

const char* TranslateCategory(Category category) {
    switch (category) {
    case Category::Core:
        return "Core";
    case Category::TimeZone:
        return "TimeZone";
    case Category::Debugging:
        return "Debugging";
    case Category::Miscellaneous:
        return "Miscellaneous";
    case Category::MaxEnum:
        break;
    }
    return "Miscellaneous";
}

} // namespace Settings
