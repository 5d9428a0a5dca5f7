// SPDX-FileCopyrightText: 2014 Citra Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <regex>
#include <string>

#include <fmt/format.h>

#include "common/logging/backend.h"
#include "common/logging/log.h"
#include "common/scm_rev.h"
#include "common/settings.h"
#include "common/string_util.h"
#include "common/time_zone.h"
#include "sysvtz/calendar.h"
#include "sysvtz/errors.h"
#include "sysvtz/offset_codec.h"
#include "sysvtz/time_zone.h"
#include "sysvtz_cmd/cmd_config.h"

#undef _UNICODE
#include <getopt.h>
#ifndef _MSC_VER
#include <unistd.h>
#endif

namespace {

enum class Query {
    Describe,
    Utc,
    Unix,
    Local,
    Transitions,
};

void PrintHelp(const char* argv0) {
    std::cout << "Usage: " << argv0
              << " [options] [recipe]\n"
                 "-c, --config FILE       Load the specified configuration file\n"
                 "-e, --examples          List example recipes and exit\n"
                 "-h, --help              Display this help and exit\n"
                 "-l, --local DATETIME    Resolve a local reading (YYYY-MM-DDTHH:MM:SS)\n"
                 "-n, --name NAME         Override the display name of the time zone\n"
                 "-t, --transitions YEAR  Print DST transitions starting at YEAR\n"
                 "-u, --utc DATETIME      Query a UTC instant (YYYY-MM-DDTHH:MM:SS)\n"
                 "-s, --unix SECONDS      Query a UTC instant given as Unix seconds\n"
                 "-S, --system            Use a fixed-offset recipe built from the host's "
                 "current UTC offset\n"
                 "-v, --version           Output version information and exit\n";
}

void PrintVersion() {
    std::cout << Common::g_build_fullname << std::endl;
}

void PrintExamples() {
    for (const auto& example : Common::TimeZone::GetExampleRecipes()) {
        fmt::print("{:<40} {}\n", example.recipe, example.description);
    }
}

int ReportFailure(std::string_view what, Result rc) {
    fmt::print(stderr, "{}: {}\n", what, SysVTz::GetResultDescription(rc));
    LOG_ERROR(Frontend, "{} failed with {}", what, rc);
    return 1;
}

/// Parses `YYYY-MM-DDTHH:MM:SS`, a space is accepted in place of the `T`.
Result ParseDateTime(SysVTz::CivilInstant& out_instant, const std::string& text) {
    static const std::regex re(R"(^(-?\d{1,9})-(\d{2})-(\d{2})[T ](\d{2}):(\d{2}):(\d{2})$)");
    std::smatch match;
    R_UNLESS(std::regex_match(text, match, re), SysVTz::ResultInvalidArgument);

    const SysVTz::CalendarTime calendar{
        .year = std::strtoll(match[1].str().c_str(), nullptr, 10),
        .month = static_cast<s8>(std::stoi(match[2].str())),
        .day = static_cast<s8>(std::stoi(match[3].str())),
        .hour = static_cast<s8>(std::stoi(match[4].str())),
        .minute = static_cast<s8>(std::stoi(match[5].str())),
        .second = static_cast<s8>(std::stoi(match[6].str())),
    };
    R_RETURN(SysVTz::ToCivilInstant(out_instant, calendar));
}

Result ParseInteger(s64& out_value, const char* text) {
    char* end = nullptr;
    errno = 0;
    const long long value = std::strtoll(text, &end, 10);
    R_UNLESS(end != text && *end == '\0' && errno == 0, SysVTz::ResultInvalidArgument);
    out_value = static_cast<s64>(value);
    R_SUCCEED();
}

std::string DescribeRule(const SysVTz::ChangeRule& rule, s32 reference_offset) {
    const s32 clock_seconds = rule.trigger_seconds_of_day + reference_offset;
    return fmt::format("{} at {:02d}:{:02d}:{:02d} local ({:+d} s from UT midnight)",
                       rule.day_rule, clock_seconds / 3600, (clock_seconds / 60) % 60,
                       clock_seconds % 60, rule.trigger_seconds_of_day);
}

int Describe(const SysVTz::TimeZone& zone) {
    const SysVTz::TimeZoneDescriptor* descriptor{};
    if (const Result rc = zone.GetDescriptor(descriptor); rc.IsError()) {
        return ReportFailure("describe", rc);
    }

    fmt::print("name:     {}\n", descriptor->Name());
    fmt::print("recipe:   {}\n", descriptor->raw_recipe);
    fmt::print("standard: {} {}\n", descriptor->std_abbreviation,
               SysVTz::FormatOffset(descriptor->std_offset));
    if (!descriptor->dst) {
        fmt::print("daylight: none\n");
        return 0;
    }

    const auto& dst = *descriptor->dst;
    fmt::print("daylight: {} {}\n", dst.abbreviation, SysVTz::FormatOffset(dst.offset));
    fmt::print("starts:   {}\n", DescribeRule(dst.start_rule, descriptor->std_offset));
    fmt::print("ends:     {}\n", DescribeRule(dst.end_rule, dst.offset));
    return 0;
}

int QueryUtc(const SysVTz::TimeZone& zone, const SysVTz::CivilInstant& utc) {
    bool is_dst{};
    s32 offset{};
    std::string abbreviation;
    if (const Result rc = zone.IsDstForInstant(is_dst, utc); rc.IsError()) {
        return ReportFailure("dst query", rc);
    }
    if (const Result rc = zone.OffsetForInstant(offset, utc); rc.IsError()) {
        return ReportFailure("offset query", rc);
    }
    if (const Result rc = zone.ShortNameForInstant(abbreviation, utc); rc.IsError()) {
        return ReportFailure("abbreviation query", rc);
    }

    fmt::print("{}Z is {} {} ({}) local {}\n", utc, abbreviation, SysVTz::FormatOffset(offset),
               is_dst ? "daylight saving" : "standard", SysVTz::ShiftCivilInstant(utc, offset));
    return 0;
}

int QueryLocal(const SysVTz::TimeZone& zone, const SysVTz::CivilInstant& local) {
    bool is_dst{};
    s32 offset{};
    if (const Result rc = zone.IsDstForLocal(is_dst, local); rc.IsError()) {
        return ReportFailure("local time", rc);
    }
    if (const Result rc = zone.OffsetForLocal(offset, local); rc.IsError()) {
        return ReportFailure("local time", rc);
    }

    fmt::print("{} local is {} ({}) = {}Z\n", local, SysVTz::FormatOffset(offset),
               is_dst ? "daylight saving" : "standard",
               SysVTz::ShiftCivilInstant(local, -static_cast<s64>(offset)));
    return 0;
}

int PrintTransitions(const SysVTz::TimeZone& zone, s64 first_year) {
    const SysVTz::TimeZoneDescriptor* descriptor{};
    if (const Result rc = zone.GetDescriptor(descriptor); rc.IsError()) {
        return ReportFailure("transitions", rc);
    }

    const s32 years = Settings::values.transition_years.GetValue();
    for (s64 year = first_year; year < first_year + years; year++) {
        SysVTz::YearTransitions transitions{};
        if (const Result rc = zone.GetTransitionsForYear(transitions, year); rc.IsError()) {
            return ReportFailure("transitions", rc);
        }
        fmt::print("{}: {} starts {}Z (local {} {}), ends {}Z (local {} {})\n", year,
                   descriptor->dst->abbreviation, transitions.dst_start,
                   SysVTz::ShiftCivilInstant(transitions.dst_start, descriptor->std_offset),
                   descriptor->std_abbreviation, transitions.dst_end,
                   SysVTz::ShiftCivilInstant(transitions.dst_end, descriptor->dst->offset),
                   descriptor->dst->abbreviation);
    }
    return 0;
}

} // Anonymous namespace

int main(int argc, char** argv) {
    int option_index = 0;
    std::optional<std::string> config_path;
    std::optional<std::string> recipe;
    std::optional<std::string> name;
    std::string query_argument;
    Query query = Query::Describe;
    bool use_system_zone = false;

    static struct option long_options[] = {
        // clang-format off
        {"config", required_argument, 0, 'c'},
        {"examples", no_argument, 0, 'e'},
        {"help", no_argument, 0, 'h'},
        {"local", required_argument, 0, 'l'},
        {"name", required_argument, 0, 'n'},
        {"transitions", required_argument, 0, 't'},
        {"utc", required_argument, 0, 'u'},
        {"unix", required_argument, 0, 's'},
        {"system", no_argument, 0, 'S'},
        {"version", no_argument, 0, 'v'},
        {0, 0, 0, 0},
        // clang-format on
    };

    while (optind < argc) {
        int arg = getopt_long(argc, argv, "c:ehl:n:t:u:s:Sv", long_options, &option_index);
        if (arg != -1) {
            switch (static_cast<char>(arg)) {
            case 'c':
                config_path = optarg;
                break;
            case 'e':
                PrintExamples();
                return 0;
            case 'h':
                PrintHelp(argv[0]);
                return 0;
            case 'l':
                query = Query::Local;
                query_argument = optarg;
                break;
            case 'n':
                name = optarg;
                break;
            case 't':
                query = Query::Transitions;
                query_argument = optarg;
                break;
            case 'u':
                query = Query::Utc;
                query_argument = optarg;
                break;
            case 's': {
                s64 value{};
                if (ParseInteger(value, optarg).IsError()) {
                    std::cout << "Wrong format for option --unix\n";
                    PrintHelp(argv[0]);
                    return 1;
                }
                query = Query::Unix;
                query_argument = optarg;
                break;
            }
            case 'S':
                use_system_zone = true;
                break;
            case 'v':
                PrintVersion();
                return 0;
            default:
                PrintHelp(argv[0]);
                return 1;
            }
        } else {
            // Recipes copied from a TZ= assignment often keep their quotes
            recipe = Common::StripQuotes(Common::StripSpaces(argv[optind]));
            optind++;
        }
    }

    CmdConfig config{config_path};

    // The logger picks up log_filter, log_file and use_color_console from the loaded config
    Common::Log::Initialize();
    Common::Log::Start();
    Settings::LogSettings();

    if (use_system_zone) {
        recipe = Common::TimeZone::FindSystemTimeZone();
    } else if (!recipe.has_value()) {
        recipe = Settings::values.default_recipe.GetValue();
    }
    if (!name.has_value() && !Settings::values.display_name.GetValue().empty()) {
        name = Settings::values.display_name.GetValue();
    }

    LOG_INFO(Frontend, "Using recipe \"{}\"", *recipe);

    SysVTz::TimeZone zone;
    int status = 0;
    if (const Result rc = zone.Initialize(*recipe, name); rc.IsError()) {
        status = ReportFailure(fmt::format("\"{}\"", *recipe), rc);
    } else {
        switch (query) {
        case Query::Describe:
            status = Describe(zone);
            break;
        case Query::Utc: {
            SysVTz::CivilInstant utc{};
            if (const Result rc = ParseDateTime(utc, query_argument); rc.IsError()) {
                status = ReportFailure(query_argument, rc);
                break;
            }
            status = QueryUtc(zone, utc);
            break;
        }
        case Query::Unix: {
            s64 seconds{};
            if (const Result rc = ParseInteger(seconds, query_argument.c_str()); rc.IsError()) {
                status = ReportFailure(query_argument, rc);
                break;
            }
            status = QueryUtc(zone, SysVTz::CivilInstantFromUnixSeconds(seconds));
            break;
        }
        case Query::Local: {
            SysVTz::CivilInstant local{};
            if (const Result rc = ParseDateTime(local, query_argument); rc.IsError()) {
                status = ReportFailure(query_argument, rc);
                break;
            }
            status = QueryLocal(zone, local);
            break;
        }
        case Query::Transitions: {
            s64 year{};
            if (const Result rc = ParseInteger(year, query_argument.c_str()); rc.IsError()) {
                status = ReportFailure(query_argument, rc);
                break;
            }
            status = PrintTransitions(zone, year);
            break;
        }
        }
    }

    Common::Log::Stop();
    return status;
}
