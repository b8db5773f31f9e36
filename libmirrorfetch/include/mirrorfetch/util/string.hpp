// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_UTIL_STRING_HPP
#define MIRRORFETCH_UTIL_STRING_HPP

#include <optional>
#include <string>
#include <string_view>

namespace mirrorfetch::util
{
    [[nodiscard]] auto to_lower(char c) -> char;
    [[nodiscard]] auto to_lower(std::string_view str) -> std::string;

    [[nodiscard]] auto to_upper(char c) -> char;
    [[nodiscard]] auto to_upper(std::string_view str) -> std::string;

    [[nodiscard]] auto lstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input, char c) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input) -> std::string_view;

    /**
     * Parse a non negative decimal integer, the whole input must be consumed.
     */
    [[nodiscard]] auto parse_size(std::string_view input) -> std::optional<std::size_t>;
}
#endif
