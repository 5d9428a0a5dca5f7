// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <functional>
#include <string>
#include <vector>
#include "common/settings_common.h"

namespace Settings {

BasicSetting::BasicSetting(Linkage& linkage, const std::string& name, enum Category category_,
                           bool save_, u32 specialization_)
    : label{name}, category{category_}, id{linkage.count}, save{save_},
      specialization{specialization_} {
    linkage.by_key.insert({name, this});
    linkage.by_category[category].push_back(this);
    linkage.count++;
}

BasicSetting::~BasicSetting() = default;

bool BasicSetting::Save() const {
    return save;
}

Category BasicSetting::GetCategory() const {
    return category;
}

u32 BasicSetting::Specialization() const {
    return specialization;
}

const std::string& BasicSetting::GetLabel() const {
    return label;
}

Linkage::Linkage(u32 initial_count) : count{initial_count} {}
Linkage::~Linkage() = default;

} // namespace Settings
