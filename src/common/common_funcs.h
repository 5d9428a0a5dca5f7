// SPDX-FileCopyrightText: 2014 Citra Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#ifndef _MSC_VER

#if defined(__x86_64__) || defined(_M_X64)
#define Crash() __asm__ __volatile__("int $3")
#else
#define Crash() __builtin_trap()
#endif

#else // _MSC_VER

extern "C" {
__declspec(dllimport) void __stdcall DebugBreak(void);
}
#define Crash() DebugBreak()

#endif // _MSC_VER ndef

#define SYSVTZ_NON_COPYABLE(cls)                                                                   \
    cls(const cls&) = delete;                                                                      \
    cls& operator=(const cls&) = delete

#define SYSVTZ_NON_MOVEABLE(cls)                                                                   \
    cls(cls&&) = delete;                                                                           \
    cls& operator=(cls&&) = delete
