/*
 * expression.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-3-14

Description: OnCalendar expression parsing

**************************************************/

#ifndef ONCAL_CALENDAR_EXPRESSION_HPP
#define ONCAL_CALENDAR_EXPRESSION_HPP

#include <optional>
#include <string_view>

#include "oncal/calendar/field_parser.hpp"

namespace oncal {

/**
 * @brief The expression has no components, more than three, or components
 * that cannot be told apart.
 */
class FieldCountError : public ParseError {
public:
    using ParseError::ParseError;
};

#define THROW_FIELD_COUNT_ERROR(...)                                  \
    throw oncal::FieldCountError(ONCAL_FILE_NAME, ONCAL_FILE_LINE,    \
                                 ONCAL_FUNC_NAME, __VA_ARGS__)

/**
 * @brief A parsed calendar event: one value set per field.
 *
 * Default-constructed, it matches midnight of every day from 1970 to 2200.
 * Negative days count from the end of the month, -1 being the last day.
 */
struct Specification {
    WeekdaySet weekdays = WeekdaySet::full();
    YearSet years = YearSet::full();
    MonthSet months = MonthSet::full();
    DaySet days = DaySet::range(1, 31);
    HourSet hours{0};
    MinuteSet minutes{0};
    SecondSet seconds{0};

    auto operator==(const Specification& other) const -> bool = default;
};

/// Role of one whitespace separated piece of an expression.
enum class ComponentKind { Weekday, Date, Time, Unrecognized };

/**
 * @brief Classifies a component by its shape.
 *
 * Anything starting with a letter is a weekday list. A component holding a
 * `:` is a time, one holding `-` or `~` is a date, and one holding both is
 * unrecognized. Remaining tokens (`*`, bare numbers) are treated as weekday
 * lists so that the weekday parser reports them.
 */
[[nodiscard]] auto classifyComponent(std::string_view component) noexcept
    -> ComponentKind;

/**
 * @brief Looks up a named expression such as "minutely" or "weekly".
 *
 * @param name Case-insensitive name, already trimmed.
 * @return The expanded specification, or nullopt for unknown names.
 */
[[nodiscard]] auto shorthandSpecification(std::string_view name)
    -> std::optional<Specification>;

/**
 * @brief Parses a full expression `[weekday[,]] [date] [time]`.
 *
 * Dates are `[year-]month-day` or `[year-]month~day`, times are
 * `hour:minute[:second]`. Omitted parts keep the Specification defaults;
 * an omitted second is 0.
 *
 * @throws FieldCountError for a wrong number of components.
 * @throws BadFieldError for an invalid field.
 */
[[nodiscard]] auto parseExpression(std::string_view expression)
    -> Specification;

}  // namespace oncal

#endif  // ONCAL_CALENDAR_EXPRESSION_HPP
