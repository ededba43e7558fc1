/*
 * timestamp.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-3-14

Description: Wall-clock timestamp with an optional time zone

**************************************************/

#ifndef ONCAL_CALENDAR_TIMESTAMP_HPP
#define ONCAL_CALENDAR_TIMESTAMP_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

namespace oncal {

/**
 * @brief A calendar timestamp as produced by the backward search.
 *
 * The wall-clock fields are authoritative. A timestamp may carry a time zone,
 * in which case the instant and the UTC offset are derived by localizing the
 * wall clock in that zone; otherwise it is a naive wall-clock value.
 *
 * Local times that are skipped or repeated by a transition are resolved with
 * the pre-transition offset, matching absl::TimeZone::At().pre.
 *
 * Only the wall clock is stored, so fromInstant() loses which pass of a
 * repeated hour the instant was in. An instant in the second pass (e.g.
 * 2020-10-25T01:30Z in Europe/Riga, local 03:30+02:00) reads back through
 * instant() as the first pass, one hour earlier, and a backward search
 * started from it does not see occurrences between the two readings.
 */
class Timestamp {
public:
    Timestamp() = default;

    explicit Timestamp(absl::CivilSecond local) : local_(local) {}

    Timestamp(absl::CivilSecond local, absl::TimeZone zone)
        : local_(local), zone_(zone) {}

    /**
     * @brief Builds a zoned timestamp from an absolute instant.
     */
    [[nodiscard]] static auto fromInstant(absl::Time instant,
                                          absl::TimeZone zone) -> Timestamp;

    /**
     * @brief Current time in the given zone.
     */
    [[nodiscard]] static auto now(absl::TimeZone zone) -> Timestamp;

    [[nodiscard]] auto local() const noexcept -> absl::CivilSecond {
        return local_;
    }
    [[nodiscard]] auto hasZone() const noexcept -> bool {
        return zone_.has_value();
    }
    [[nodiscard]] auto zone() const noexcept
        -> const std::optional<absl::TimeZone>& {
        return zone_;
    }

    /**
     * @brief Absolute instant; naive timestamps are read as UTC.
     */
    [[nodiscard]] auto instant() const -> absl::Time;

    /**
     * @brief Offset from UTC in effect for this wall clock, or nullopt for a
     * naive timestamp.
     */
    [[nodiscard]] auto utcOffset() const -> std::optional<std::chrono::seconds>;

    /**
     * @brief Same wall clock, localized into another zone (or made naive).
     */
    [[nodiscard]] auto withZone(std::optional<absl::TimeZone> zone) const
        -> Timestamp {
        return zone ? Timestamp(local_, *zone) : Timestamp(local_);
    }

    /**
     * @brief ISO 8601 rendering, e.g. "2020-04-29T03:30:00+03:00".
     *
     * Naive timestamps have no offset suffix.
     */
    [[nodiscard]] auto toIsoString() const -> std::string;

    auto operator==(const Timestamp& other) const -> bool;
    auto operator<(const Timestamp& other) const -> bool;

private:
    absl::CivilSecond local_;
    std::optional<absl::TimeZone> zone_;
};

/**
 * @brief Loads a zone from the system tz database, e.g. "Europe/Riga".
 *
 * @throws error::InvalidArgument if the zone cannot be loaded.
 */
[[nodiscard]] auto loadTimeZone(std::string_view name) -> absl::TimeZone;

}  // namespace oncal

#endif  // ONCAL_CALENDAR_TIMESTAMP_HPP
