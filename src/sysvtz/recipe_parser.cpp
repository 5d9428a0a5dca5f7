// SPDX-FileCopyrightText: Copyright 2023 yuzu Emulator Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <algorithm>
#include <utility>

#include "common/logging/log.h"
#include "sysvtz/errors.h"
#include "sysvtz/offset_codec.h"
#include "sysvtz/recipe_parser.h"

namespace SysVTz {
namespace {
constexpr std::size_t MinAbbreviationLength = 3;
/// Large enough for every valid field, small enough that leading digits never overflow.
constexpr u32 NumberSaturation = 100000;

constexpr bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

constexpr bool IsAlpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

constexpr bool IsBracketedAbbreviationChar(char c) {
    return IsAlpha(c) || IsDigit(c) || c == '+' || c == '-';
}

constexpr bool IsOffsetChar(char c) {
    return IsDigit(c) || c == '+' || c == '-' || c == ':';
}

/// Reads a decimal number, leading zeros allowed, advancing `position` past it.
bool GetNumber(std::string_view token, std::size_t& position, u32& value) {
    const std::size_t start = position;
    value = 0;
    while (position < token.size() && IsDigit(token[position])) {
        value = std::min(value * 10 + static_cast<u32>(token[position] - '0'), NumberSaturation);
        position++;
    }
    return position != start;
}

bool GetBoundedNumber(std::string_view token, std::size_t& position, u32& value, u32 min,
                      u32 max) {
    return GetNumber(token, position, value) && value >= min && value <= max;
}

bool Consume(std::string_view token, std::size_t& position, char expected) {
    if (position < token.size() && token[position] == expected) {
        position++;
        return true;
    }
    return false;
}

class RecipeParser {
public:
    explicit RecipeParser(std::string_view recipe_) : recipe{recipe_} {}

    Result Parse(TimeZoneDescriptor& out_descriptor) {
        TimeZoneDescriptor descriptor{};
        descriptor.raw_recipe = std::string(recipe);

        R_TRY(ParseAbbreviation(descriptor.std_abbreviation));
        R_TRY(ParseOffsetField(descriptor.std_offset));

        if (!AtEnd()) {
            DaylightSavingInfo dst{};
            R_TRY(ParseAbbreviation(dst.abbreviation));

            dst.offset = descriptor.std_offset + DefaultDaylightSavingShift;
            if (!AtEnd() && IsOffsetChar(recipe[position])) {
                R_TRY(ParseOffsetField(dst.offset));
            }

            if (AtEnd()) {
                dst.start_rule =
                    MakeChangeRule(DefaultStartRule, DefaultChangeTimeOfDay, descriptor.std_offset);
                dst.end_rule = MakeChangeRule(DefaultEndRule, DefaultChangeTimeOfDay, dst.offset);
            } else {
                R_TRY(ParseRules(dst, descriptor.std_offset));
            }
            descriptor.dst = std::move(dst);
        }

        out_descriptor = std::move(descriptor);
        R_SUCCEED();
    }

private:
    bool AtEnd() const {
        return position >= recipe.size();
    }

    Result Fail(std::string_view reason, std::string_view fragment) const {
        LOG_ERROR(SysVTz_Recipe, "Invalid recipe \"{}\": {} at \"{}\"", recipe, reason, fragment);
        R_THROW(ResultInvalidRecipe);
    }

    Result ParseAbbreviation(std::string& out_abbreviation) {
        const std::string_view rest = recipe.substr(position);
        if (rest.empty()) {
            R_RETURN(Fail("missing abbreviation", rest));
        }

        if (rest[0] == '<') {
            const auto close = rest.find('>');
            if (close == std::string_view::npos) {
                R_RETURN(Fail("unterminated abbreviation", rest));
            }
            const std::string_view inner = rest.substr(1, close - 1);
            if (inner.size() < MinAbbreviationLength ||
                !std::all_of(inner.begin(), inner.end(), IsBracketedAbbreviationChar)) {
                R_RETURN(Fail("bad quoted abbreviation", rest.substr(0, close + 1)));
            }
            out_abbreviation = std::string(inner);
            position += close + 1;
            R_SUCCEED();
        }

        const auto length = static_cast<std::size_t>(
            std::find_if_not(rest.begin(), rest.end(), IsAlpha) - rest.begin());
        if (length < MinAbbreviationLength) {
            R_RETURN(Fail("bad abbreviation", rest));
        }
        out_abbreviation = std::string(rest.substr(0, length));
        position += length;
        R_SUCCEED();
    }

    Result ParseOffsetField(s32& out_offset) {
        const std::string_view rest = recipe.substr(position);
        const auto length = static_cast<std::size_t>(
            std::find_if_not(rest.begin(), rest.end(), IsOffsetChar) - rest.begin());
        const std::string_view token = rest.substr(0, length);
        if (ParseOffset(out_offset, token).IsError()) {
            R_RETURN(Fail("bad offset", token.empty() ? rest : token));
        }
        position += length;
        R_SUCCEED();
    }

    Result ParseRules(DaylightSavingInfo& dst, s32 std_offset) {
        const std::string_view rest = recipe.substr(position);
        if (rest[0] != ',') {
            R_RETURN(Fail("expected ',' before the change rules", rest));
        }

        const std::string_view rules = rest.substr(1);
        const auto separator = rules.find(',');
        if (separator == std::string_view::npos) {
            R_RETURN(Fail("missing end rule", rest));
        }

        R_TRY(ParseChangeRule(dst.start_rule, rules.substr(0, separator), std_offset));
        R_TRY(ParseChangeRule(dst.end_rule, rules.substr(separator + 1), dst.offset));
        position = recipe.size();
        R_SUCCEED();
    }

    Result ParseChangeRule(ChangeRule& out_rule, std::string_view token,
                           s32 reference_offset) const {
        const auto slash = token.find('/');
        const std::string_view day_token = token.substr(0, slash);

        DayRuleSpec day_rule{};
        if (ParseDayRule(day_rule, day_token).IsError()) {
            R_RETURN(Fail("bad day rule", token));
        }

        s32 clock_seconds = DefaultChangeTimeOfDay;
        if (slash != std::string_view::npos &&
            ParseTimeOfDay(clock_seconds, token.substr(slash + 1)).IsError()) {
            R_RETURN(Fail("bad change time", token));
        }

        out_rule = MakeChangeRule(day_rule, clock_seconds, reference_offset);
        R_SUCCEED();
    }

    std::string_view recipe;
    std::size_t position{};
};
} // namespace

Result ParseDayRule(DayRuleSpec& out_rule, std::string_view token) {
    std::size_t position{};

    if (Consume(token, position, 'J')) {
        u32 day{};
        R_UNLESS(GetBoundedNumber(token, position, day, 1, MaxJulianDay), ResultMalformedRule);
        R_UNLESS(position == token.size(), ResultMalformedRule);
        out_rule = JulianDay{day};
        R_SUCCEED();
    }

    if (Consume(token, position, 'M')) {
        MonthWeekDay rule{};
        R_UNLESS(GetBoundedNumber(token, position, rule.month, 1, 12), ResultMalformedRule);
        R_UNLESS(Consume(token, position, '.'), ResultMalformedRule);
        R_UNLESS(GetBoundedNumber(token, position, rule.week, 1, LastWeekOfMonth),
                 ResultMalformedRule);
        R_UNLESS(Consume(token, position, '.'), ResultMalformedRule);
        R_UNLESS(GetBoundedNumber(token, position, rule.weekday, 0, 6), ResultMalformedRule);
        R_UNLESS(position == token.size(), ResultMalformedRule);
        out_rule = rule;
        R_SUCCEED();
    }

    u32 day{};
    R_UNLESS(GetBoundedNumber(token, position, day, 0, MaxZeroBasedDay), ResultMalformedRule);
    R_UNLESS(position == token.size(), ResultMalformedRule);
    out_rule = ZeroBasedDay{day};
    R_SUCCEED();
}

Result ParseRecipe(TimeZoneDescriptor& out_descriptor, std::string_view recipe,
                   std::optional<std::string> name) {
    TimeZoneDescriptor descriptor{};
    R_TRY(RecipeParser{recipe}.Parse(descriptor));

    descriptor.display_name = name.value_or(descriptor.raw_recipe);
    if (descriptor.dst) {
        LOG_DEBUG(SysVTz_Recipe, "Parsed \"{}\": {} {}, {} {}, {} to {}", recipe,
                  descriptor.std_abbreviation, FormatOffset(descriptor.std_offset),
                  descriptor.dst->abbreviation, FormatOffset(descriptor.dst->offset),
                  descriptor.dst->start_rule.day_rule, descriptor.dst->end_rule.day_rule);
    } else {
        LOG_DEBUG(SysVTz_Recipe, "Parsed \"{}\": {} {}", recipe, descriptor.std_abbreviation,
                  FormatOffset(descriptor.std_offset));
    }

    out_descriptor = std::move(descriptor);
    R_SUCCEED();
}

} // namespace SysVTz
