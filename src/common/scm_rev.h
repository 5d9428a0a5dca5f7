// SPDX-FileCopyrightText: 2014 Citra Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

namespace Common {

extern const char g_build_name[];
extern const char g_build_version[];
extern const char g_build_fullname[];

} // namespace Common
