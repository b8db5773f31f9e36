// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_UTIL_URL_MANIP_HPP
#define MIRRORFETCH_UTIL_URL_MANIP_HPP

#include <string>
#include <string_view>

namespace mirrorfetch::util
{
    /**
     * Return the scheme of the URL in lower case, or an empty string if none is found.
     */
    [[nodiscard]] auto url_get_scheme(std::string_view url) -> std::string;

    [[nodiscard]] auto is_file_uri(std::string_view url) -> bool;

    /**
     * Return the host of the URL, without user info nor port.
     */
    [[nodiscard]] auto url_get_host(std::string_view url) -> std::string;

    /**
     * Transform an absolute path to a `file://` URI.
     */
    [[nodiscard]] auto abs_path_to_url(std::string_view path) -> std::string;

    /**
     * Return the base URL with exactly one trailing slash.
     *
     * Two mirrors whose normalized base URLs compare equal are the same mirror.
     */
    [[nodiscard]] auto normalize_base_url(std::string_view url) -> std::string;

    /**
     * Join URL parts, with exactly one slash between two consecutive parts.
     */
    template <typename... Args>
    [[nodiscard]] auto url_concat(const Args&... args) -> std::string;

    /********************
     *  Implementation  *
     ********************/

    namespace detail
    {
        inline auto as_string_view(std::string_view str) -> std::string_view
        {
            return str;
        }

        inline auto as_string_view(const char& c) -> std::string_view
        {
            return { &c, 1 };
        }

        template <typename... Args>
        auto url_concat_impl(const Args&... args) -> std::string
        {
            auto join_two = [](std::string& out, std::string_view to_add)
            {
                if (!out.empty() && !to_add.empty())
                {
                    const bool out_has_slash = out.back() == '/';
                    const bool to_add_has_slash = to_add.front() == '/';
                    if (out_has_slash && to_add_has_slash)
                    {
                        to_add = to_add.substr(1);
                    }
                    if (!out_has_slash && !to_add_has_slash)
                    {
                        out += '/';
                    }
                }
                out += to_add;
            };

            std::string result;
            result.reserve(((args.size() + 1) + ...));
            (join_two(result, args), ...);
            return result;
        }
    }

    template <typename... Args>
    auto url_concat(const Args&... args) -> std::string
    {
        return detail::url_concat_impl(detail::as_string_view(args)...);
    }
}
#endif
