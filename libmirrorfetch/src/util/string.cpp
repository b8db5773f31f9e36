// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cctype>
#include <charconv>

#include "mirrorfetch/util/string.hpp"

namespace mirrorfetch::util
{
    namespace
    {
        auto is_space(char c) -> bool
        {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        template <typename UnaryFunc>
        auto transform_chars(std::string_view str, UnaryFunc func) -> std::string
        {
            auto out = std::string();
            out.reserve(str.size());
            std::transform(str.cbegin(), str.cend(), std::back_inserter(out), func);
            return out;
        }
    }

    auto to_lower(char c) -> char
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto to_lower(std::string_view str) -> std::string
    {
        return transform_chars(str, [](char c) { return to_lower(c); });
    }

    auto to_upper(char c) -> char
    {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    auto to_upper(std::string_view str) -> std::string
    {
        return transform_chars(str, [](char c) { return to_upper(c); });
    }

    auto lstrip(std::string_view input) -> std::string_view
    {
        const auto it = std::find_if_not(input.cbegin(), input.cend(), is_space);
        return input.substr(static_cast<std::size_t>(std::distance(input.cbegin(), it)));
    }

    auto rstrip(std::string_view input) -> std::string_view
    {
        const auto it = std::find_if_not(input.crbegin(), input.crend(), is_space);
        return input.substr(0, input.size() - static_cast<std::size_t>(std::distance(input.crbegin(), it)));
    }

    auto rstrip(std::string_view input, char c) -> std::string_view
    {
        const auto end = input.find_last_not_of(c);
        return (end == std::string_view::npos) ? input.substr(0, 0) : input.substr(0, end + 1);
    }

    auto strip(std::string_view input) -> std::string_view
    {
        return rstrip(lstrip(input));
    }

    auto parse_size(std::string_view input) -> std::optional<std::size_t>
    {
        std::size_t value = 0;
        const auto* const first = input.data();
        const auto* const last = input.data() + input.size();
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (input.empty() || ec != std::errc() || ptr != last)
        {
            return std::nullopt;
        }
        return value;
    }
}
