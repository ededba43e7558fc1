/*
 * bounded_set.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-3-14

Description: Fixed-capacity integer set over a closed interval

**************************************************/

#ifndef ONCAL_TYPE_BOUNDED_SET_HPP
#define ONCAL_TYPE_BOUNDED_SET_HPP

#include <bitset>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <vector>

namespace oncal {

/**
 * @brief A set of integers drawn from the closed interval [Lo, Hi].
 *
 * Membership is stored in a std::bitset, so lookups are O(1) and the
 * ordered queries used by the backward search (greatest member not above a
 * value, largest member) walk at most Hi - Lo + 1 bits.
 *
 * @tparam Lo Smallest representable value.
 * @tparam Hi Largest representable value.
 */
template <int Lo, int Hi>
class BoundedSet {
    static_assert(Lo <= Hi, "BoundedSet requires Lo <= Hi");

public:
    static constexpr int kMin = Lo;
    static constexpr int kMax = Hi;
    static constexpr std::size_t kCapacity = static_cast<std::size_t>(Hi - Lo + 1);

    constexpr BoundedSet() noexcept = default;

    BoundedSet(std::initializer_list<int> values) {
        for (int value : values) {
            insert(value);
        }
    }

    /**
     * @brief Returns a set holding every value of [from, to], clamped to
     * [Lo, Hi].
     */
    [[nodiscard]] static auto range(int from, int to) -> BoundedSet {
        BoundedSet result;
        for (int value = from; value <= to; ++value) {
            result.insert(value);
        }
        return result;
    }

    [[nodiscard]] static auto full() -> BoundedSet { return range(Lo, Hi); }

    [[nodiscard]] static constexpr auto inBounds(int value) noexcept -> bool {
        return value >= Lo && value <= Hi;
    }

    /**
     * @brief Adds a value; values outside [Lo, Hi] are ignored.
     * @return true if the value is representable.
     */
    auto insert(int value) -> bool {
        if (!inBounds(value)) {
            return false;
        }
        bits_.set(index(value));
        return true;
    }

    auto merge(const BoundedSet& other) -> BoundedSet& {
        bits_ |= other.bits_;
        return *this;
    }

    [[nodiscard]] auto contains(int value) const -> bool {
        return inBounds(value) && bits_.test(index(value));
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return bits_.none(); }
    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return bits_.count();
    }

    /**
     * @brief Greatest member that is <= value.
     *
     * Values above Hi are searched from Hi downward; values below Lo have no
     * floor.
     */
    [[nodiscard]] auto floor(int value) const -> std::optional<int> {
        if (value < Lo) {
            return std::nullopt;
        }
        for (int probe = value > Hi ? Hi : value; probe >= Lo; --probe) {
            if (bits_.test(index(probe))) {
                return probe;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto max() const -> std::optional<int> { return floor(Hi); }

    [[nodiscard]] auto min() const -> std::optional<int> {
        for (int probe = Lo; probe <= Hi; ++probe) {
            if (bits_.test(index(probe))) {
                return probe;
            }
        }
        return std::nullopt;
    }

    /// Members in ascending order.
    [[nodiscard]] auto values() const -> std::vector<int> {
        std::vector<int> result;
        result.reserve(size());
        for (int probe = Lo; probe <= Hi; ++probe) {
            if (bits_.test(index(probe))) {
                result.push_back(probe);
            }
        }
        return result;
    }

    auto operator==(const BoundedSet& other) const noexcept -> bool {
        return bits_ == other.bits_;
    }

private:
    static constexpr auto index(int value) noexcept -> std::size_t {
        return static_cast<std::size_t>(value - Lo);
    }

    std::bitset<kCapacity> bits_;
};

}  // namespace oncal

#endif  // ONCAL_TYPE_BOUNDED_SET_HPP
