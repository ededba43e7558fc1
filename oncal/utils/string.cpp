/*
 * string.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: String helpers used by the expression parsers

**************************************************/

#include "string.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <ranges>
#include <system_error>

namespace oncal::utils {

auto trim(std::string_view line, std::string_view symbols) -> std::string {
    if (line.empty()) {
        return {};
    }

    const auto isSymbol = [&symbols](char c) {
        return symbols.find(c) != std::string_view::npos;
    };

    auto start = std::ranges::find_if_not(line, isSymbol);
    if (start == line.end()) {
        return {};
    }

    auto rbegin = std::make_reverse_iterator(line.end());
    auto rend = std::make_reverse_iterator(start);
    auto last = std::ranges::find_if_not(std::ranges::subrange(rbegin, rend),
                                         isSymbol);
    return std::string(start, last.base());
}

auto toLower(std::string_view str) -> std::string {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

auto explode(std::string_view text, char symbol) -> std::vector<std::string> {
    std::vector<std::string> parts;
    parts.reserve(static_cast<std::size_t>(std::ranges::count(text, symbol)) + 1);

    std::size_t begin = 0;
    while (true) {
        auto pos = text.find(symbol, begin);
        if (pos == std::string_view::npos) {
            parts.emplace_back(text.substr(begin));
            break;
        }
        parts.emplace_back(text.substr(begin, pos - begin));
        begin = pos + 1;
    }
    return parts;
}

auto splitWhitespace(std::string_view text) -> std::vector<std::string> {
    const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };

    std::vector<std::string> words;
    auto it = text.begin();
    while (it != text.end()) {
        it = std::find_if_not(it, text.end(), isSpace);
        auto end = std::find_if(it, text.end(), isSpace);
        if (it != end) {
            words.emplace_back(it, end);
        }
        it = end;
    }
    return words;
}

auto parseDigits(std::string_view token) -> std::optional<int> {
    if (token.empty() ||
        !std::ranges::all_of(token, [](unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        return std::nullopt;
    }

    int value = 0;
    auto [ptr, ec] =
        std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc() || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace oncal::utils
