// SPDX-FileCopyrightText: Copyright 2021 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <string>

#include "common/common_types.h"
#include "common/settings_common.h"
#include "common/settings_setting.h"
#include "common/time_zone.h"

namespace Settings {

const char* TranslateCategory(Settings::Category category);

#ifndef CANNOT_EXPLICITLY_INSTANTIATE
// Instantiate the classes elsewhere (settings.cpp) to reduce compiler/linker work
#define SETTING(TYPE, RANGED) extern template class Setting<TYPE, RANGED>

SETTING(bool, false);
SETTING(s32, true);
SETTING(std::string, false);

#undef SETTING
#endif

struct Values {
    Linkage linkage{};

    // Time zone
    Setting<std::string> default_recipe{linkage, Common::TimeZone::GetDefaultTimeZone(),
                                        "default_recipe", Category::TimeZone};
    Setting<std::string> display_name{linkage, "", "display_name", Category::TimeZone};
    Setting<s32, true> transition_years{
        linkage, 1, 1, 50, "transition_years", Category::Core, Specialization::Countable};

    // Debugging
    Setting<bool> use_debug_asserts{linkage, false, "use_debug_asserts", Category::Debugging};

    // Miscellaneous
    Setting<std::string> log_filter{linkage, "*:Info", "log_filter", Category::Miscellaneous};
    Setting<std::string> log_file{linkage, "", "log_file", Category::Miscellaneous};
    Setting<bool> use_color_console{linkage, true, "use_color_console", Category::Miscellaneous};
};

extern Values values;

void LogSettings();

/// Restores every registered setting to the value it was created with.
void RestoreDefaults();

} // namespace Settings
