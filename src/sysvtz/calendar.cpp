// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include "common/logging/log.h"
#include "sysvtz/calendar.h"
#include "sysvtz/errors.h"

namespace SysVTz {
namespace {
// Days from 0000-03-01 to 1970-01-01.
constexpr s64 UnixEpochShift = 719468;
constexpr s64 DaysPerEra = 146097;
constexpr s64 YearsPerEra = 400;

template <typename T>
constexpr T FloorDiv(T value, T divisor) {
    return value >= 0 ? value / divisor : -1 - (-1 - value) / divisor;
}

template <typename T>
constexpr T FloorMod(T value, T divisor) {
    return value - FloorDiv(value, divisor) * divisor;
}
} // namespace

s64 CivilDateToDayNumber(const CivilDate& date) {
    // Years are counted from March so the leap day is the last day of the counted year.
    const s64 year = date.month <= 2 ? date.year - 1 : date.year;
    const s64 era = FloorDiv(year, YearsPerEra);
    const s64 year_of_era = year - era * YearsPerEra;
    const s64 month_from_march = date.month > 2 ? date.month - 3 : date.month + 9;
    const s64 day_of_year = (153 * month_from_march + 2) / 5 + date.day - 1;
    const s64 day_of_era =
        year_of_era * DaysPerNormalYear + year_of_era / 4 - year_of_era / 100 + day_of_year;
    return era * DaysPerEra + day_of_era - UnixEpochShift;
}

CivilDate DayNumberToCivilDate(s64 day_number) {
    const s64 shifted = day_number + UnixEpochShift;
    const s64 era = FloorDiv(shifted, DaysPerEra);
    const s64 day_of_era = shifted - era * DaysPerEra;
    const s64 year_of_era =
        (day_of_era - day_of_era / 1460 + day_of_era / 36524 - day_of_era / 146096) /
        DaysPerNormalYear;
    const s64 day_of_year =
        day_of_era - (DaysPerNormalYear * year_of_era + year_of_era / 4 - year_of_era / 100);
    const s64 month_from_march = (5 * day_of_year + 2) / 153;
    const s32 day = static_cast<s32>(day_of_year - (153 * month_from_march + 2) / 5 + 1);
    const s32 month =
        static_cast<s32>(month_from_march < 10 ? month_from_march + 3 : month_from_march - 9);
    const s64 year = year_of_era + era * YearsPerEra + (month <= 2 ? 1 : 0);
    return {year, month, day};
}

YearDay DayNumberToYearDay(s64 day_number) {
    const CivilDate date = DayNumberToCivilDate(day_number);
    const s64 new_year = CivilDateToDayNumber({date.year, 1, 1});
    return {date.year, static_cast<s32>(day_number - new_year + 1)};
}

s32 DateToDayOfYear(s64 year, s32 month, s32 day) {
    s32 day_of_year = day;
    for (s32 index = 1; index < month; ++index) {
        day_of_year += GetMonthLength(year, index);
    }
    return day_of_year;
}

s32 GetWeekday(s64 year, s32 month, s32 day) {
    return GetWeekdayOfDayNumber(CivilDateToDayNumber({year, month, day}));
}

s32 GetWeekdayOfDayNumber(s64 day_number) {
    // 1970-01-01 was a Thursday.
    constexpr s64 epoch_week_day = 4;
    return static_cast<s32>(FloorMod<s64>(day_number + epoch_week_day, DaysPerWeek));
}

CivilInstant CivilInstantFromUnixSeconds(s64 unix_seconds) {
    return {
        .day_number = FloorDiv<s64>(unix_seconds, SecondsPerDay),
        .seconds_of_day = static_cast<u32>(FloorMod<s64>(unix_seconds, SecondsPerDay)),
    };
}

s64 CivilInstantToUnixSeconds(const CivilInstant& instant) {
    return instant.day_number * SecondsPerDay + static_cast<s64>(instant.seconds_of_day);
}

CivilInstant ShiftCivilInstant(const CivilInstant& instant, s64 seconds) {
    const s64 total = static_cast<s64>(instant.seconds_of_day) + seconds;
    return {
        .day_number = instant.day_number + FloorDiv<s64>(total, SecondsPerDay),
        .seconds_of_day = static_cast<u32>(FloorMod<s64>(total, SecondsPerDay)),
    };
}

Result ToCivilInstant(CivilInstant& out_instant, const CalendarTime& calendar) {
    const bool date_valid = calendar.month >= 1 && calendar.month <= MonthsPerYear &&
                            calendar.day >= 1 &&
                            calendar.day <= GetMonthLength(calendar.year, calendar.month);
    const bool leap_second = calendar.hour == 23 && calendar.minute == 59 && calendar.second == 60;
    const bool time_valid = calendar.hour >= 0 && calendar.hour <= 23 && calendar.minute >= 0 &&
                            calendar.minute <= 59 && calendar.second >= 0 &&
                            (calendar.second <= 59 || leap_second);
    if (!date_valid || !time_valid) {
        LOG_DEBUG(SysVTz_Calendar, "Rejected calendar reading {}", calendar);
        R_THROW(ResultInvalidCalendarDate);
    }

    out_instant.day_number = CivilDateToDayNumber({calendar.year, calendar.month, calendar.day});
    out_instant.seconds_of_day = static_cast<u32>(
        calendar.hour * SecondsPerHour + calendar.minute * SecondsPerMinute + calendar.second);
    R_SUCCEED();
}

CalendarTime ToCalendarTime(const CivilInstant& instant) {
    const CivilDate date = DayNumberToCivilDate(instant.day_number);
    if (instant.seconds_of_day >= static_cast<u32>(SecondsPerDay)) {
        return {date.year, static_cast<s8>(date.month), static_cast<s8>(date.day), 23, 59, 60};
    }
    const auto seconds = static_cast<s32>(instant.seconds_of_day);
    return {
        .year = date.year,
        .month = static_cast<s8>(date.month),
        .day = static_cast<s8>(date.day),
        .hour = static_cast<s8>(seconds / SecondsPerHour),
        .minute = static_cast<s8>((seconds / SecondsPerMinute) % 60),
        .second = static_cast<s8>(seconds % SecondsPerMinute),
    };
}

} // namespace SysVTz
