// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <utility>

#include "common/logging/log.h"
#include "sysvtz/errors.h"
#include "sysvtz/local_time_resolver.h"
#include "sysvtz/recipe_parser.h"
#include "sysvtz/time_zone.h"

namespace SysVTz {

Result TimeZone::Initialize(std::string_view recipe, std::optional<std::string> name) {
    TimeZoneDescriptor descriptor{};
    R_TRY(ParseRecipe(descriptor, recipe, std::move(name)));

    m_descriptor = std::move(descriptor);
    m_initialized = true;
    LOG_INFO(SysVTz, "Time zone {} initialized from \"{}\"", m_descriptor.Name(), recipe);
    R_SUCCEED();
}

Result TimeZone::GetName(std::string& out_name) const {
    R_UNLESS(m_initialized, ResultNotInitialized);
    out_name = std::string(m_descriptor.Name());
    R_SUCCEED();
}

Result TimeZone::HasDstChanges(bool& out_has_dst) const {
    R_UNLESS(m_initialized, ResultNotInitialized);
    out_has_dst = m_descriptor.HasDstChanges();
    R_SUCCEED();
}

Result TimeZone::GetDescriptor(const TimeZoneDescriptor*& out_descriptor) const {
    R_UNLESS(m_initialized, ResultNotInitialized);
    out_descriptor = &m_descriptor;
    R_SUCCEED();
}

Result TimeZone::IsDstForInstant(bool& out_is_dst, const CivilInstant& utc) const {
    R_UNLESS(m_initialized, ResultNotInitialized);
    R_RETURN(SysVTz::IsDstForInstant(out_is_dst, m_descriptor, utc));
}

Result TimeZone::OffsetForInstant(s32& out_offset, const CivilInstant& utc) const {
    R_UNLESS(m_initialized, ResultNotInitialized);
    R_RETURN(SysVTz::OffsetForInstant(out_offset, m_descriptor, utc));
}

Result TimeZone::ShortNameForInstant(std::string& out_name, const CivilInstant& utc) const {
    R_UNLESS(m_initialized, ResultNotInitialized);
    R_RETURN(AbbreviationForInstant(out_name, m_descriptor, utc));
}

Result TimeZone::IsDstForLocal(bool& out_is_dst, const CivilInstant& local) const {
    R_UNLESS(m_initialized, ResultNotInitialized);
    R_RETURN(SysVTz::IsDstForLocal(out_is_dst, m_descriptor, local));
}

Result TimeZone::OffsetForLocal(s32& out_offset, const CivilInstant& local) const {
    R_UNLESS(m_initialized, ResultNotInitialized);
    R_RETURN(SysVTz::OffsetForLocal(out_offset, m_descriptor, local));
}

Result TimeZone::GetTransitionsForYear(YearTransitions& out_transitions, s64 year) const {
    R_UNLESS(m_initialized, ResultNotInitialized);
    R_RETURN(SysVTz::GetTransitionsForYear(out_transitions, m_descriptor, year));
}

} // namespace SysVTz
