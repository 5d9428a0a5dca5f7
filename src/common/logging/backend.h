// SPDX-FileCopyrightText: 2014 Citra Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include "common/logging/filter.h"

namespace Common::Log {

/// Initializes the logging system. This should be the first thing called in main.
void Initialize();

void Start();

/// Explicitly stops the logger thread and flushes the buffers
void Stop();

void DisableLoggingInTests();
} // namespace Common::Log
