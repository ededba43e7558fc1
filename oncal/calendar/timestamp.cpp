/*
 * timestamp.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-3-14

Description: Wall-clock timestamp with an optional time zone

**************************************************/

#include "timestamp.hpp"

#include <cstdint>

#include <absl/strings/str_format.h>
#include <absl/time/clock.h>
#include <spdlog/spdlog.h>

#include "oncal/error/exception.hpp"

namespace oncal {

auto loadTimeZone(std::string_view name) -> absl::TimeZone {
    absl::TimeZone zone;
    if (!absl::LoadTimeZone(std::string(name), &zone)) {
        spdlog::error("Failed to load time zone '{}'", name);
        THROW_INVALID_ARGUMENT("Unknown time zone: ", name);
    }
    return zone;
}

auto Timestamp::fromInstant(absl::Time instant, absl::TimeZone zone)
    -> Timestamp {
    return Timestamp(absl::ToCivilSecond(instant, zone), zone);
}

auto Timestamp::now(absl::TimeZone zone) -> Timestamp {
    return fromInstant(absl::Now(), zone);
}

auto Timestamp::instant() const -> absl::Time {
    if (!zone_) {
        return absl::FromCivil(local_, absl::UTCTimeZone());
    }
    return zone_->At(local_).pre;
}

auto Timestamp::utcOffset() const -> std::optional<std::chrono::seconds> {
    if (!zone_) {
        return std::nullopt;
    }
    auto asUtc = absl::FromCivil(local_, absl::UTCTimeZone());
    auto offset = absl::ToInt64Seconds(asUtc - instant());
    return std::chrono::seconds(offset);
}

auto Timestamp::toIsoString() const -> std::string {
    std::string result = absl::FormatCivilTime(local_);

    auto offset = utcOffset();
    if (!offset) {
        return result;
    }

    std::int64_t total = offset->count();
    char sign = total < 0 ? '-' : '+';
    total = total < 0 ? -total : total;
    absl::StrAppendFormat(&result, "%c%02d:%02d", sign, total / 3600,
                          (total / 60) % 60);
    if (total % 60 != 0) {
        absl::StrAppendFormat(&result, ":%02d", total % 60);
    }
    return result;
}

auto Timestamp::operator==(const Timestamp& other) const -> bool {
    if (local_ != other.local_ || zone_.has_value() != other.zone_.has_value()) {
        return false;
    }
    return !zone_ || zone_->name() == other.zone_->name();
}

auto Timestamp::operator<(const Timestamp& other) const -> bool {
    if (zone_ && other.zone_) {
        return instant() < other.instant();
    }
    return local_ < other.local_;
}

}  // namespace oncal
