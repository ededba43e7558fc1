/*
 * backward_iterator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-3-14

Description: Backward enumeration of calendar event occurrences

**************************************************/

#ifndef ONCAL_CALENDAR_BACKWARD_ITERATOR_HPP
#define ONCAL_CALENDAR_BACKWARD_ITERATOR_HPP

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include "oncal/calendar/expression.hpp"
#include "oncal/calendar/timestamp.hpp"

namespace oncal {

/// Concrete days of one month, after count-from-end days are resolved.
using MonthDaySet = BoundedSet<1, 31>;

[[nodiscard]] auto daysInMonth(absl::civil_year_t year, int month) -> int;

/**
 * @brief Resolves a day set against the length of a concrete month.
 *
 * Positive days past the end of the month are dropped; a negative day -n
 * becomes length - n + 1.
 */
[[nodiscard]] auto resolveDays(const DaySet& days, absl::civil_year_t year,
                               int month) -> MonthDaySet;

/**
 * @brief Checks every field of a wall-clock time, weekday included.
 */
[[nodiscard]] auto matches(const Specification& spec, absl::CivilSecond time)
    -> bool;

/**
 * @brief Greatest wall-clock second strictly before `before` matching spec.
 *
 * Fields are checked from year down to second. A field outside its set is
 * lowered to the nearest member below it and the smaller fields restart at
 * the end of that unit; when no member is left the search borrows from the
 * next larger unit. The weekday is only reachable by moving the date.
 *
 * @return nullopt once the search would go below kMinYear.
 */
[[nodiscard]] auto previousMatch(const Specification& spec,
                                 absl::CivilSecond before)
    -> std::optional<absl::CivilSecond>;

/**
 * @brief Lazily yields the occurrences of a calendar expression, newest
 * first, strictly before a start time.
 *
 * The expression is parsed on construction. Every result is localized in the
 * zone of the start timestamp, so the UTC offset follows DST changes. Wall
 * clocks that the zone skips at a forward transition are not produced;
 * repeated ones are produced once, with the pre-transition offset. An
 * instance is not safe for concurrent use; the Specification it holds is
 * immutable and may be shared between iterators.
 *
 * @code
 * oncal::BackwardIterator it("Sun *~7/1", start);
 * for (const auto& ts : it.take(3)) {
 *     std::cout << ts.toIsoString() << '\n';
 * }
 * @endcode
 */
class BackwardIterator {
public:
    /**
     * @throws ParseError if the expression is invalid.
     */
    BackwardIterator(std::string_view expression, const Timestamp& start);

    BackwardIterator(std::shared_ptr<const Specification> spec,
                     const Timestamp& start);

    BackwardIterator(const Specification& spec, const Timestamp& start);

    /**
     * @brief Starts from the current time in `zone`.
     */
    [[nodiscard]] static auto fromNow(std::string_view expression,
                                      absl::TimeZone zone) -> BackwardIterator;

    [[nodiscard]] auto spec() const noexcept -> const Specification& {
        return *spec_;
    }

    [[nodiscard]] auto sharedSpec() const noexcept
        -> std::shared_ptr<const Specification> {
        return spec_;
    }

    /// Wall clock of the last result, or of the start before the first call.
    [[nodiscard]] auto cursor() const noexcept -> absl::CivilSecond {
        return cursor_;
    }

    [[nodiscard]] auto exhausted() const noexcept -> bool {
        return exhausted_;
    }

    /**
     * @brief Produces the next older occurrence.
     * @return nullopt when no occurrence is left; every later call returns
     * nullopt too.
     */
    [[nodiscard]] auto next() -> std::optional<Timestamp>;

    /**
     * @brief Collects up to `count` further occurrences.
     */
    [[nodiscard]] auto take(std::size_t count) -> std::vector<Timestamp>;

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Timestamp;
        using difference_type = std::ptrdiff_t;
        using pointer = const Timestamp*;
        using reference = const Timestamp&;

        Iterator() = default;
        explicit Iterator(BackwardIterator* owner) : owner_(owner) {
            advance();
        }

        auto operator*() const -> reference { return *current_; }
        auto operator->() const -> pointer { return &*current_; }

        auto operator++() -> Iterator& {
            advance();
            return *this;
        }
        void operator++(int) { advance(); }

        auto operator==(std::default_sentinel_t) const noexcept -> bool {
            return !current_.has_value();
        }

    private:
        void advance() {
            if (owner_ == nullptr) {
                current_.reset();
                return;
            }
            current_ = owner_->next();
        }

        BackwardIterator* owner_ = nullptr;
        std::optional<Timestamp> current_;
    };

    /// Range access; iteration consumes the iterator's own cursor.
    [[nodiscard]] auto begin() -> Iterator { return Iterator(this); }
    [[nodiscard]] auto end() const noexcept -> std::default_sentinel_t {
        return std::default_sentinel;
    }

private:
    std::shared_ptr<const Specification> spec_;
    std::optional<absl::TimeZone> zone_;
    absl::CivilSecond cursor_;
    bool exhausted_ = false;
};

}  // namespace oncal

#endif  // ONCAL_CALENDAR_BACKWARD_ITERATOR_HPP
