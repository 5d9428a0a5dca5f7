// SPDX-FileCopyrightText: 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include "common/logging/log.h"
#include "sysvtz_cmd/cmd_config.h"

CmdConfig::CmdConfig(const std::optional<std::string> config_path) {
    if (config_path.has_value()) {
        Initialize(config_path);
    } else {
        Initialize("sysvtz-cmd");
    }
}

CmdConfig::~CmdConfig() = default;

void CmdConfig::ReloadAllValues() {
    Reload();
}

void CmdConfig::SaveAllValues() {
    SaveValues();
}
