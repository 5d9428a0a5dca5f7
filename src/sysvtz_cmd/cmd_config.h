// SPDX-FileCopyrightText: 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include "frontend_common/config.h"

class CmdConfig final : public Config {
public:
    explicit CmdConfig(std::optional<std::string> config_path);
    ~CmdConfig() override;

    void ReloadAllValues() override;
    void SaveAllValues() override;
};
