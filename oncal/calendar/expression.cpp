/*
 * expression.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-3-14

Description: OnCalendar expression parsing

**************************************************/

#include "expression.hpp"

#include <cctype>
#include <functional>
#include <string>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "oncal/utils/string.hpp"

namespace oncal {

namespace {

const std::unordered_map<std::string, std::function<void(Specification&)>>
    kShorthands = {
        {"minutely",
         [](Specification& spec) {
             spec.hours = HourSet::full();
             spec.minutes = MinuteSet::full();
         }},
        {"hourly", [](Specification& spec) { spec.hours = HourSet::full(); }},
        {"daily", [](Specification&) {}},
        {"midnight", [](Specification&) {}},
        {"weekly", [](Specification& spec) { spec.weekdays = {0}; }},
        {"monthly", [](Specification& spec) { spec.days = {1}; }},
        {"yearly",
         [](Specification& spec) {
             spec.months = {1};
             spec.days = {1};
         }},
        {"annually",
         [](Specification& spec) {
             spec.months = {1};
             spec.days = {1};
         }},
        {"quarterly",
         [](Specification& spec) {
             spec.months = {1, 4, 7, 10};
             spec.days = {1};
         }},
        {"semiannually",
         [](Specification& spec) {
             spec.months = {1, 7};
             spec.days = {1};
         }}};

struct Components {
    std::optional<std::string> weekday;
    std::optional<std::string> date;
    std::optional<std::string> time;
};

auto splitComponents(std::string_view expression) -> Components {
    auto pieces = utils::splitWhitespace(expression);
    if (pieces.empty() || pieces.size() > 3) {
        THROW_FIELD_COUNT_ERROR("Wrong number of fields in '", expression,
                                "': ", pieces.size());
    }

    Components components;
    const auto assign = [&expression](std::optional<std::string>& slot,
                                      std::string piece) {
        if (slot) {
            THROW_FIELD_COUNT_ERROR("Wrong number of fields in '", expression,
                                    "': '", *slot, "' and '", piece,
                                    "' have the same role");
        }
        slot = std::move(piece);
    };

    for (auto& piece : pieces) {
        switch (classifyComponent(piece)) {
            case ComponentKind::Weekday:
                if (piece.size() > 1 && piece.back() == ',') {
                    piece.pop_back();
                }
                assign(components.weekday, std::move(piece));
                break;
            case ComponentKind::Date:
                assign(components.date, std::move(piece));
                break;
            case ComponentKind::Time:
                assign(components.time, std::move(piece));
                break;
            case ComponentKind::Unrecognized:
                THROW_FIELD_COUNT_ERROR("Wrong number of fields in '",
                                        expression, "': cannot classify '",
                                        piece, "'");
        }
    }
    return components;
}

void applyDate(std::string_view date, Specification& spec) {
    std::optional<std::string_view> year;
    std::string_view month;
    std::string_view day;
    DayMode mode = DayMode::FromStart;

    if (auto tilde = date.find('~'); tilde != std::string_view::npos) {
        mode = DayMode::FromEnd;
        auto left = date.substr(0, tilde);
        day = date.substr(tilde + 1);
        if (auto dash = left.find('-'); dash != std::string_view::npos) {
            year = left.substr(0, dash);
            month = left.substr(dash + 1);
        } else {
            month = left;
        }
    } else {
        auto first = date.find('-');
        auto second = date.find('-', first + 1);
        if (second == std::string_view::npos) {
            month = date.substr(0, first);
            day = date.substr(first + 1);
        } else {
            year = date.substr(0, first);
            month = date.substr(first + 1, second - first - 1);
            day = date.substr(second + 1);
        }
    }

    if (year) {
        spec.years = parseYears(*year);
    }
    spec.months = parseMonths(month);
    spec.days = parseDays(day, mode);
}

void applyTime(std::string_view time, Specification& spec) {
    auto first = time.find(':');
    auto second = time.find(':', first + 1);

    spec.hours = parseHours(time.substr(0, first));
    if (second == std::string_view::npos) {
        spec.minutes = parseMinutes(time.substr(first + 1));
        spec.seconds = {0};
    } else {
        spec.minutes =
            parseMinutes(time.substr(first + 1, second - first - 1));
        spec.seconds = parseSeconds(time.substr(second + 1));
    }
}

}  // namespace

auto classifyComponent(std::string_view component) noexcept -> ComponentKind {
    if (component.empty()) {
        return ComponentKind::Unrecognized;
    }
    if (std::isalpha(static_cast<unsigned char>(component.front())) != 0) {
        return ComponentKind::Weekday;
    }

    const bool hasTime = component.find(':') != std::string_view::npos;
    const bool hasDate = component.find_first_of("-~") != std::string_view::npos;
    if (hasTime && hasDate) {
        return ComponentKind::Unrecognized;
    }
    if (hasTime) {
        return ComponentKind::Time;
    }
    if (hasDate) {
        return ComponentKind::Date;
    }
    return ComponentKind::Weekday;
}

auto shorthandSpecification(std::string_view name)
    -> std::optional<Specification> {
    auto it = kShorthands.find(utils::toLower(name));
    if (it == kShorthands.end()) {
        return std::nullopt;
    }
    Specification spec;
    it->second(spec);
    return spec;
}

auto parseExpression(std::string_view expression) -> Specification {
    auto text = utils::trim(expression);

    try {
        if (auto preset = shorthandSpecification(text)) {
            spdlog::debug("Expanded calendar shorthand '{}'", text);
            return *preset;
        }

        auto components = splitComponents(text);

        Specification spec;
        if (components.weekday) {
            spec.weekdays = parseWeekdays(*components.weekday);
        }
        if (components.date) {
            applyDate(*components.date, spec);
        }
        if (components.time) {
            applyTime(*components.time, spec);
        }

        spdlog::debug(
            "Parsed calendar expression '{}': {} weekdays, {} years, {} "
            "months, {} days, {} hours, {} minutes, {} seconds",
            text, spec.weekdays.size(), spec.years.size(), spec.months.size(),
            spec.days.size(), spec.hours.size(), spec.minutes.size(),
            spec.seconds.size());
        return spec;
    } catch (const ParseError& e) {
        spdlog::error("Failed to parse calendar expression '{}': {}", text,
                      e.getMessage());
        throw;
    }
}

}  // namespace oncal
