/*
 * string.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: String helpers used by the expression parsers

**************************************************/

#ifndef ONCAL_UTILS_STRING_HPP
#define ONCAL_UTILS_STRING_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oncal::utils {

/**
 * @brief Trims the specified symbols from both ends of a string.
 *
 * @param line The string_view to trim.
 * @param symbols The symbols to trim.
 * @return The trimmed string.
 */
[[nodiscard("the result of trim is not used")]]
auto trim(std::string_view line,
          std::string_view symbols = " \n\r\t\v\f") -> std::string;

auto toLower(std::string_view str) -> std::string;

/**
 * @brief Splits a string on every occurrence of a character.
 *
 * Empty pieces are kept, so "a,,b" yields three elements and "" yields one
 * empty element.
 */
auto explode(std::string_view text, char symbol) -> std::vector<std::string>;

/**
 * @brief Splits a string on runs of whitespace, dropping empty pieces.
 */
auto splitWhitespace(std::string_view text) -> std::vector<std::string>;

/**
 * @brief Parses a non-empty run of decimal digits.
 *
 * Signs, blanks, separators and any other character make the whole token
 * invalid. Values that do not fit in an int are rejected too.
 */
auto parseDigits(std::string_view token) -> std::optional<int>;

}  // namespace oncal::utils

#endif  // ONCAL_UTILS_STRING_HPP
