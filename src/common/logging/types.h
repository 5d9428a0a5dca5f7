// SPDX-FileCopyrightText: Copyright 2021 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include "common/common_types.h"

namespace Common::Log {

/// Specifies the severity or level of detail of the log message.
enum class Level : u8 {
    Trace,    ///< Extremely detailed and repetitive debugging information that is likely to
              ///< pollute logs.
    Debug,    ///< Less detailed debugging information.
    Info,     ///< Status information from important points during execution.
    Warning,  ///< Minor or potential problems found during execution of a task.
    Error,    ///< Major problems found during execution of a task that prevent it from being
              ///< completed.
    Critical, ///< Major problems during execution that threaten the stability of the entire
              ///< application.

    Count ///< Total number of logging levels
};

/**
 * Specifies the sub-system that generated the log message.
 *
 * @note If you add a new entry here, also add a corresponding one to `ALL_LOG_CLASSES` in
 *       filter.cpp.
 */
enum class Class : u8 {
    Log,               ///< Messages about the log system itself
    Common,            ///< Library routines
    Config,            ///< Emulator configuration (including commandline)
    Debug,             ///< Debugging tools
    Frontend,          ///< Command line frontend
    Settings,          ///< Settings registry and value dumps
    SysVTz,            ///< Time zone library, generic messages
    SysVTz_Calendar,   ///< Gregorian calendar conversions
    SysVTz_Recipe,     ///< Recipe string parsing
    SysVTz_Transition, ///< DST transition search for absolute instants
    SysVTz_LocalTime,  ///< Local clock reading resolution
    Count              ///< Total number of logging classes
};

} // namespace Common::Log
