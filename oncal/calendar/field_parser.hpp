/*
 * field_parser.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-3-14

Description: Parsing of single calendar fields into bounded value sets

**************************************************/

#ifndef ONCAL_CALENDAR_FIELD_PARSER_HPP
#define ONCAL_CALENDAR_FIELD_PARSER_HPP

#include <string_view>
#include <vector>

#include "oncal/error/exception.hpp"
#include "oncal/type/bounded_set.hpp"

namespace oncal {

inline constexpr int kMinYear = 1970;
inline constexpr int kMaxYear = 2200;

/// Largest magnitude accepted for a day counted from the end of the month.
inline constexpr int kMaxDaysFromEnd = 28;

using WeekdaySet = BoundedSet<0, 6>;  ///< Monday = 0 ... Sunday = 6
using YearSet = BoundedSet<kMinYear, kMaxYear>;
using MonthSet = BoundedSet<1, 12>;
/// Positive days of month plus negative ones counted from the month end.
using DaySet = BoundedSet<-kMaxDaysFromEnd, 31>;
using HourSet = BoundedSet<0, 23>;
using MinuteSet = BoundedSet<0, 59>;
using SecondSet = BoundedSet<0, 59>;

enum class FieldKind {
    DayOfWeek,
    Year,
    Month,
    DayOfMonth,
    Hour,
    Minute,
    Second
};

/// Human readable name of a field, e.g. "day-of-month".
[[nodiscard]] auto fieldName(FieldKind kind) noexcept -> std::string_view;

enum class DayMode {
    FromStart,  ///< 1 is the first day of the month
    FromEnd     ///< 1 is the last day of the month
};

/**
 * @brief Base class of every error raised while parsing an expression.
 */
class ParseError : public error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief A single field token could not be parsed or violates its bounds.
 */
class BadFieldError : public ParseError {
public:
    BadFieldError(const char* file, int line, const char* func,
                  FieldKind kind, std::string_view token)
        : ParseError(file, line, func, "Bad ", fieldName(kind), ": '", token,
                     "'"),
          kind_(kind) {}

    [[nodiscard]] auto kind() const noexcept -> FieldKind { return kind_; }

private:
    FieldKind kind_;
};

#define THROW_BAD_FIELD(kind, token)                                   \
    throw oncal::BadFieldError(ONCAL_FILE_NAME, ONCAL_FILE_LINE,       \
                               ONCAL_FUNC_NAME, kind, token)

/**
 * @brief Parses one field token into its sorted list of values.
 *
 * The token is a comma separated list whose items are `*`, `a`, `a..b`,
 * `a/n` or `a..b/n`. Day-of-week tokens use English day names instead of
 * numbers. Years given as a bare one or two digit number are expanded with
 * the 1970 pivot. With DayMode::FromEnd the day values come back negated.
 *
 * @param token Raw field text, without surrounding separators.
 * @param kind Field the token belongs to; selects the bounds.
 * @param mode Only meaningful for FieldKind::DayOfMonth.
 * @return Values in ascending order, never empty.
 * @throws BadFieldError if the token is malformed or out of bounds.
 */
[[nodiscard]] auto parseField(std::string_view token, FieldKind kind,
                              DayMode mode = DayMode::FromStart)
    -> std::vector<int>;

[[nodiscard]] auto parseWeekdays(std::string_view token) -> WeekdaySet;
[[nodiscard]] auto parseYears(std::string_view token) -> YearSet;
[[nodiscard]] auto parseMonths(std::string_view token) -> MonthSet;
[[nodiscard]] auto parseDays(std::string_view token,
                             DayMode mode = DayMode::FromStart) -> DaySet;
[[nodiscard]] auto parseHours(std::string_view token) -> HourSet;
[[nodiscard]] auto parseMinutes(std::string_view token) -> MinuteSet;
[[nodiscard]] auto parseSeconds(std::string_view token) -> SecondSet;

/**
 * @brief Maps a two digit year onto 1970-2069.
 *
 * 0-69 become 2000-2069 and 70-99 become 1970-1999.
 */
[[nodiscard]] constexpr auto expandCentury(int year) noexcept -> int {
    return year < 70 ? 2000 + year : 1900 + year;
}

}  // namespace oncal

#endif  // ONCAL_CALENDAR_FIELD_PARSER_HPP
