/*
 * backward_iterator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-3-14

Description: Backward enumeration of calendar event occurrences

**************************************************/

#include "backward_iterator.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace oncal {

namespace {

/// Last second inside the given civil unit.
template <typename Unit>
auto lastSecondOf(Unit unit) -> absl::CivilSecond {
    return absl::CivilSecond(unit + 1) - 1;
}

/// Last second of the unit preceding the one containing `time`.
template <typename Unit>
auto lastSecondBefore(absl::CivilSecond time) -> absl::CivilSecond {
    return absl::CivilSecond(Unit(time)) - 1;
}

auto weekdayOf(absl::CivilDay day) -> int {
    // absl::Weekday enumerates Monday first.
    return static_cast<int>(absl::GetWeekday(day));
}

}  // namespace

auto daysInMonth(absl::civil_year_t year, int month) -> int {
    auto lastDay = absl::CivilDay(absl::CivilMonth(year, month) + 1) - 1;
    return lastDay.day();
}

auto resolveDays(const DaySet& days, absl::civil_year_t year, int month)
    -> MonthDaySet {
    const int length = daysInMonth(year, month);

    MonthDaySet resolved;
    for (int day = DaySet::kMin; day <= DaySet::kMax; ++day) {
        if (!days.contains(day)) {
            continue;
        }
        if (day < 0) {
            resolved.insert(length + day + 1);
        } else if (day <= length) {
            resolved.insert(day);
        }
    }
    return resolved;
}

auto matches(const Specification& spec, absl::CivilSecond time) -> bool {
    if (time.year() < kMinYear || time.year() > kMaxYear) {
        return false;
    }
    return spec.years.contains(static_cast<int>(time.year())) &&
           spec.months.contains(time.month()) &&
           resolveDays(spec.days, time.year(), time.month())
               .contains(time.day()) &&
           spec.weekdays.contains(weekdayOf(absl::CivilDay(time))) &&
           spec.hours.contains(time.hour()) &&
           spec.minutes.contains(time.minute()) &&
           spec.seconds.contains(time.second());
}

auto previousMatch(const Specification& spec, absl::CivilSecond before)
    -> std::optional<absl::CivilSecond> {
    absl::CivilSecond t = before - 1;

    while (t.year() >= kMinYear) {
        auto year = spec.years.floor(static_cast<int>(
            std::min<absl::civil_year_t>(t.year(), kMaxYear)));
        if (!year) {
            return std::nullopt;
        }
        if (*year != t.year()) {
            t = lastSecondOf(absl::CivilYear(*year));
        }

        auto month = spec.months.floor(t.month());
        if (!month) {
            t = lastSecondBefore<absl::CivilYear>(t);
            continue;
        }
        if (*month != t.month()) {
            t = lastSecondOf(absl::CivilMonth(t.year(), *month));
        }

        auto day = resolveDays(spec.days, t.year(), t.month()).floor(t.day());
        if (!day) {
            t = lastSecondBefore<absl::CivilMonth>(t);
            continue;
        }
        if (*day != t.day()) {
            t = lastSecondOf(absl::CivilDay(t.year(), t.month(), *day));
        }

        if (!spec.weekdays.contains(weekdayOf(absl::CivilDay(t)))) {
            t = lastSecondBefore<absl::CivilDay>(t);
            continue;
        }

        auto hour = spec.hours.floor(t.hour());
        if (!hour) {
            t = lastSecondBefore<absl::CivilDay>(t);
            continue;
        }
        if (*hour != t.hour()) {
            t = lastSecondOf(
                absl::CivilHour(t.year(), t.month(), t.day(), *hour));
        }

        auto minute = spec.minutes.floor(t.minute());
        if (!minute) {
            t = lastSecondBefore<absl::CivilHour>(t);
            continue;
        }
        if (*minute != t.minute()) {
            t = lastSecondOf(absl::CivilMinute(t.year(), t.month(), t.day(),
                                               t.hour(), *minute));
        }

        auto second = spec.seconds.floor(t.second());
        if (!second) {
            t = lastSecondBefore<absl::CivilMinute>(t);
            continue;
        }
        return absl::CivilSecond(t.year(), t.month(), t.day(), t.hour(),
                                 t.minute(), *second);
    }
    return std::nullopt;
}

BackwardIterator::BackwardIterator(std::string_view expression,
                                   const Timestamp& start)
    : BackwardIterator(
          std::make_shared<const Specification>(parseExpression(expression)),
          start) {}

BackwardIterator::BackwardIterator(const Specification& spec,
                                   const Timestamp& start)
    : BackwardIterator(std::make_shared<const Specification>(spec), start) {}

BackwardIterator::BackwardIterator(std::shared_ptr<const Specification> spec,
                                   const Timestamp& start)
    : spec_(std::move(spec)), zone_(start.zone()), cursor_(start.local()) {
    if (!spec_) {
        THROW_INVALID_ARGUMENT("BackwardIterator requires a specification");
    }
    spdlog::debug("BackwardIterator starting before {}",
                  start.toIsoString());
}

auto BackwardIterator::fromNow(std::string_view expression,
                               absl::TimeZone zone) -> BackwardIterator {
    return BackwardIterator(expression, Timestamp::now(zone));
}

auto BackwardIterator::next() -> std::optional<Timestamp> {
    if (exhausted_) {
        return std::nullopt;
    }

    auto match = previousMatch(*spec_, cursor_);
    // Wall-clock times skipped by a forward transition never happen
    while (match && zone_ &&
           zone_->At(*match).kind == absl::TimeZone::TimeInfo::SKIPPED) {
        spdlog::trace("Skipping nonexistent local time {} in {}",
                      absl::FormatCivilTime(*match), zone_->name());
        cursor_ = *match;
        match = previousMatch(*spec_, cursor_);
    }
    if (!match) {
        exhausted_ = true;
        spdlog::debug("No calendar occurrence left before {}",
                      absl::FormatCivilTime(cursor_));
        return std::nullopt;
    }

    cursor_ = *match;
    auto result = zone_ ? Timestamp(*match, *zone_) : Timestamp(*match);
    spdlog::trace("Calendar occurrence {}", result.toIsoString());
    return result;
}

auto BackwardIterator::take(std::size_t count) -> std::vector<Timestamp> {
    std::vector<Timestamp> results;
    while (results.size() < count) {
        auto value = next();
        if (!value) {
            break;
        }
        results.push_back(std::move(*value));
    }
    return results;
}

}  // namespace oncal
