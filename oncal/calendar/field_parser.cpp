/*
 * field_parser.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-3-14

Description: Parsing of single calendar fields into bounded value sets

**************************************************/

#include "field_parser.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <string>

#include "oncal/utils/string.hpp"

namespace oncal {

namespace {

struct Domain {
    int lo;
    int hi;
};

constexpr std::array<std::string_view, 7> kWeekdayNames = {
    "monday", "tuesday", "wednesday", "thursday",
    "friday", "saturday", "sunday"};

auto domainOf(FieldKind kind, DayMode mode) -> Domain {
    switch (kind) {
        case FieldKind::DayOfWeek:
            return {0, 6};
        case FieldKind::Year:
            return {kMinYear, kMaxYear};
        case FieldKind::Month:
            return {1, 12};
        case FieldKind::DayOfMonth:
            return mode == DayMode::FromEnd ? Domain{1, kMaxDaysFromEnd}
                                            : Domain{1, 31};
        case FieldKind::Hour:
            return {0, 23};
        case FieldKind::Minute:
        case FieldKind::Second:
            return {0, 59};
    }
    return {0, 0};
}

auto weekdayIndex(std::string_view name) -> std::optional<int> {
    auto lowered = utils::toLower(name);
    for (std::size_t i = 0; i < kWeekdayNames.size(); ++i) {
        if (lowered == kWeekdayNames[i] ||
            lowered == kWeekdayNames[i].substr(0, 3)) {
            return static_cast<int>(i);
        }
    }
    return std::nullopt;
}

/// Appends first, first + step, ... up to last. Requires first <= last.
void appendSteps(int first, int last, int step, std::vector<int>& out) {
    for (int value = first;; value += step) {
        out.push_back(value);
        if (last - value < step) {
            break;
        }
    }
}

/**
 * Expands one comma separated item of a numeric field.
 *
 * With descendingStep set, `a/n` walks from a down to the domain minimum
 * instead of up to the maximum. That is how count-from-end days read: the
 * implicit end of the range is the last day of the month.
 */
void expandItem(std::string_view item, std::string_view token, FieldKind kind,
                Domain domain, bool descendingStep, bool onlyItem,
                std::vector<int>& out) {
    std::string_view base = item;
    std::optional<int> step;

    if (auto slash = item.find('/'); slash != std::string_view::npos) {
        base = item.substr(0, slash);
        step = utils::parseDigits(item.substr(slash + 1));
        if (!step || *step <= 0) {
            THROW_BAD_FIELD(kind, token);
        }
    }

    if (base == "*") {
        if (step || !onlyItem) {
            THROW_BAD_FIELD(kind, token);
        }
        for (int value = domain.lo; value <= domain.hi; ++value) {
            out.push_back(value);
        }
        return;
    }

    const auto inDomain = [&domain](std::optional<int> value) {
        return value && *value >= domain.lo && *value <= domain.hi;
    };

    if (auto dots = base.find(".."); dots != std::string_view::npos) {
        auto first = utils::parseDigits(base.substr(0, dots));
        auto last = utils::parseDigits(base.substr(dots + 2));
        if (!inDomain(first) || !inDomain(last) || *first > *last) {
            THROW_BAD_FIELD(kind, token);
        }
        appendSteps(*first, *last, step.value_or(1), out);
        return;
    }

    auto start = utils::parseDigits(base);
    if (!inDomain(start)) {
        THROW_BAD_FIELD(kind, token);
    }
    if (!step) {
        out.push_back(*start);
    } else if (descendingStep) {
        for (int value = *start;; value -= *step) {
            out.push_back(value);
            if (value - domain.lo < *step) {
                break;
            }
        }
    } else {
        appendSteps(*start, domain.hi, *step, out);
    }
}

void expandWeekdayItem(std::string_view item, std::string_view token,
                       std::vector<int>& out) {
    std::string_view firstName = item;
    std::string_view lastName = item;

    if (auto dots = item.find(".."); dots != std::string_view::npos) {
        firstName = item.substr(0, dots);
        lastName = item.substr(dots + 2);
    } else if (auto dash = item.find('-'); dash != std::string_view::npos) {
        firstName = item.substr(0, dash);
        lastName = item.substr(dash + 1);
    }

    auto first = weekdayIndex(firstName);
    auto last = weekdayIndex(lastName);
    if (!first || !last || *first > *last) {
        THROW_BAD_FIELD(FieldKind::DayOfWeek, token);
    }
    for (int day = *first; day <= *last; ++day) {
        out.push_back(day);
    }
}

template <typename Set>
auto toSet(const std::vector<int>& values) -> Set {
    Set result;
    for (int value : values) {
        result.insert(value);
    }
    return result;
}

}  // namespace

auto fieldName(FieldKind kind) noexcept -> std::string_view {
    switch (kind) {
        case FieldKind::DayOfWeek:
            return "day-of-week";
        case FieldKind::Year:
            return "year";
        case FieldKind::Month:
            return "month";
        case FieldKind::DayOfMonth:
            return "day-of-month";
        case FieldKind::Hour:
            return "hour";
        case FieldKind::Minute:
            return "minute";
        case FieldKind::Second:
            return "second";
    }
    return "field";
}

auto parseField(std::string_view token, FieldKind kind, DayMode mode)
    -> std::vector<int> {
    const bool fromEnd =
        kind == FieldKind::DayOfMonth && mode == DayMode::FromEnd;
    const auto domain = domainOf(kind, mode);

    std::vector<int> values;

    if (kind == FieldKind::Year && !token.empty() && token.size() <= 2) {
        if (auto shortYear = utils::parseDigits(token)) {
            values.push_back(expandCentury(*shortYear));
            return values;
        }
    }

    auto items = utils::explode(token, ',');
    for (const auto& item : items) {
        if (item.empty()) {
            THROW_BAD_FIELD(kind, token);
        }
        if (kind == FieldKind::DayOfWeek) {
            expandWeekdayItem(item, token, values);
        } else {
            expandItem(item, token, kind, domain, fromEnd, items.size() == 1,
                       values);
        }
    }

    if (fromEnd) {
        std::ranges::transform(values, values.begin(),
                               [](int value) { return -value; });
    }
    std::ranges::sort(values);
    auto duplicates = std::ranges::unique(values);
    values.erase(duplicates.begin(), duplicates.end());
    return values;
}

auto parseWeekdays(std::string_view token) -> WeekdaySet {
    return toSet<WeekdaySet>(parseField(token, FieldKind::DayOfWeek));
}

auto parseYears(std::string_view token) -> YearSet {
    return toSet<YearSet>(parseField(token, FieldKind::Year));
}

auto parseMonths(std::string_view token) -> MonthSet {
    return toSet<MonthSet>(parseField(token, FieldKind::Month));
}

auto parseDays(std::string_view token, DayMode mode) -> DaySet {
    return toSet<DaySet>(parseField(token, FieldKind::DayOfMonth, mode));
}

auto parseHours(std::string_view token) -> HourSet {
    return toSet<HourSet>(parseField(token, FieldKind::Hour));
}

auto parseMinutes(std::string_view token) -> MinuteSet {
    return toSet<MinuteSet>(parseField(token, FieldKind::Minute));
}

auto parseSeconds(std::string_view token) -> SecondSet {
    return toSet<SecondSet>(parseField(token, FieldKind::Second));
}

}  // namespace oncal
