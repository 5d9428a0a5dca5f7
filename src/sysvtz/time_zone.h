// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "common/common_types.h"
#include "sysvtz/common.h"
#include "sysvtz/result.h"
#include "sysvtz/time_zone_descriptor.h"
#include "sysvtz/transition_engine.h"

namespace SysVTz {

/**
 * Time zone object backed by a System V recipe. Once initialized the zone never changes, so any
 * number of threads may query it concurrently.
 */
class TimeZone {
public:
    TimeZone() = default;

    /// Parses `recipe`, optionally displaying the zone as `name` instead of the recipe.
    Result Initialize(std::string_view recipe, std::optional<std::string> name = std::nullopt);

    bool IsInitialized() const {
        return m_initialized;
    }

    bool IsFloating() const {
        return false;
    }

    bool IsUtc() const {
        return false;
    }

    bool IsOlson() const {
        return false;
    }

    /// Recipe zones do not belong to a geographic category.
    std::optional<std::string> Category() const {
        return std::nullopt;
    }

    Result GetName(std::string& out_name) const;
    Result HasDstChanges(bool& out_has_dst) const;
    Result GetDescriptor(const TimeZoneDescriptor*& out_descriptor) const;

    Result IsDstForInstant(bool& out_is_dst, const CivilInstant& utc) const;
    Result OffsetForInstant(s32& out_offset, const CivilInstant& utc) const;
    Result ShortNameForInstant(std::string& out_name, const CivilInstant& utc) const;
    Result IsDstForLocal(bool& out_is_dst, const CivilInstant& local) const;
    Result OffsetForLocal(s32& out_offset, const CivilInstant& local) const;
    Result GetTransitionsForYear(YearTransitions& out_transitions, s64 year) const;

    template <CivilInstantProvider T>
    Result IsDstForDateTime(bool& out_is_dst, const T& date_time) const {
        return IsDstForInstant(out_is_dst, date_time.GetUtcCivilInstant());
    }

    template <CivilInstantProvider T>
    Result OffsetForDateTime(s32& out_offset, const T& date_time) const {
        return OffsetForInstant(out_offset, date_time.GetUtcCivilInstant());
    }

    template <CivilInstantProvider T>
    Result ShortNameForDateTime(std::string& out_name, const T& date_time) const {
        return ShortNameForInstant(out_name, date_time.GetUtcCivilInstant());
    }

    template <CivilInstantProvider T>
    Result IsDstForLocalDateTime(bool& out_is_dst, const T& date_time) const {
        return IsDstForLocal(out_is_dst, date_time.GetLocalCivilInstant());
    }

    template <CivilInstantProvider T>
    Result OffsetForLocalDateTime(s32& out_offset, const T& date_time) const {
        return OffsetForLocal(out_offset, date_time.GetLocalCivilInstant());
    }

private:
    bool m_initialized{};
    TimeZoneDescriptor m_descriptor{};
};

} // namespace SysVTz
