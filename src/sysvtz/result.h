// SPDX-FileCopyrightText: 2014 Citra Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <type_traits>

#include <fmt/format.h>

#include "common/common_types.h"

/**
 * Identifies the module which caused the error. Error codes can be propagated through a call
 * chain, meaning that this doesn't always correspond to the module where the API call made is
 * contained.
 */
enum class ErrorModule : u32 {
    Common = 0,
    Calendar = 1,
    Recipe = 2,
    Transition = 3,
    LocalTime = 4,
    TimeZone = 5,
};

/// Encapsulates a library error code, allowing it to be separated into its constituent fields.
union Result {
    u32 raw;

    static constexpr u32 ModuleBits = 9;
    static constexpr u32 ModuleMask = (1U << ModuleBits) - 1;
    static constexpr u32 DescriptionBits = 13;
    static constexpr u32 DescriptionMask = (1U << DescriptionBits) - 1;

    Result() = default;
    constexpr explicit Result(u32 raw_) : raw(raw_) {}

    constexpr Result(ErrorModule module_, u32 description_)
        : raw((static_cast<u32>(module_) & ModuleMask) |
              ((description_ & DescriptionMask) << ModuleBits)) {}

    [[nodiscard]] constexpr bool IsSuccess() const {
        return raw == 0;
    }

    [[nodiscard]] constexpr bool IsError() const {
        return !IsSuccess();
    }

    [[nodiscard]] constexpr bool IsFailure() const {
        return !IsSuccess();
    }

    [[nodiscard]] constexpr u32 GetInnerValue() const {
        return raw;
    }

    [[nodiscard]] constexpr ErrorModule GetModule() const {
        return static_cast<ErrorModule>(raw & ModuleMask);
    }

    [[nodiscard]] constexpr u32 GetDescription() const {
        return (raw >> ModuleBits) & DescriptionMask;
    }
};
static_assert(std::is_trivial_v<Result>);

[[nodiscard]] constexpr bool operator==(const Result& a, const Result& b) {
    return a.raw == b.raw;
}

[[nodiscard]] constexpr bool operator!=(const Result& a, const Result& b) {
    return !operator==(a, b);
}

// Convenience functions for creating some common kinds of errors:

/// The default success `Result`.
constexpr Result ResultSuccess(0);

#define R_SUCCEEDED(res) (static_cast<Result>(res).IsSuccess())
#define R_FAILED(res) (static_cast<Result>(res).IsFailure())

/// Returns a result.
#define R_RETURN(res_expr)                                                                         \
    {                                                                                              \
        const Result _tmp_r_throw_rc = (res_expr);                                                 \
        return _tmp_r_throw_rc;                                                                    \
    }

/// Returns ResultSuccess()
#define R_SUCCEED() R_RETURN(ResultSuccess)

/// Throws a result.
#define R_THROW(res_expr) R_RETURN(res_expr)

/// Evaluates a boolean expression, and returns a result unless that expression is true.
#define R_UNLESS(expr, res)                                                                        \
    {                                                                                              \
        if (!(expr)) {                                                                             \
            R_THROW(res);                                                                          \
        }                                                                                          \
    }

/// Evaluates an expression that returns a result, and returns the result if it would fail.
#define R_TRY(res_expr)                                                                            \
    {                                                                                              \
        const auto _tmp_r_try_rc = (res_expr);                                                     \
        if (R_FAILED(_tmp_r_try_rc)) {                                                             \
            R_THROW(_tmp_r_try_rc);                                                                \
        }                                                                                          \
    }

template <>
struct fmt::formatter<Result> : fmt::formatter<fmt::string_view> {
    template <typename FormatContext>
    auto format(const Result& result, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{:04d}-{:04d} (0x{:X})",
                              2000 + static_cast<u32>(result.GetModule()),
                              result.GetDescription(), result.raw);
    }
};
