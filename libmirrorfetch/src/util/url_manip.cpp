// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cctype>

#include "mirrorfetch/util/string.hpp"
#include "mirrorfetch/util/url_manip.hpp"

namespace mirrorfetch::util
{
    auto url_get_scheme(std::string_view url) -> std::string
    {
        static constexpr std::string_view sep = "://";
        const auto pos = url.find(sep);
        if ((pos == std::string_view::npos) || (pos == 0))
        {
            return "";
        }
        const auto scheme = url.substr(0, pos);
        const auto is_scheme_char = [](char c)
        { return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.'; };
        for (const char c : scheme)
        {
            if (!is_scheme_char(c))
            {
                return "";
            }
        }
        return to_lower(scheme);
    }

    auto is_file_uri(std::string_view url) -> bool
    {
        return url_get_scheme(url) == "file";
    }

    auto url_get_host(std::string_view url) -> std::string
    {
        static constexpr std::string_view sep = "://";
        const auto scheme_end = url.find(sep);
        if (scheme_end == std::string_view::npos)
        {
            return "";
        }
        auto authority = url.substr(scheme_end + sep.size());
        authority = authority.substr(0, authority.find_first_of("/?#"));
        if (const auto at = authority.rfind('@'); at != std::string_view::npos)
        {
            authority = authority.substr(at + 1);
        }
        if (authority.starts_with('['))
        {
            return to_lower(authority.substr(0, authority.find(']') + 1));
        }
        return to_lower(authority.substr(0, authority.find(':')));
    }

    auto abs_path_to_url(std::string_view path) -> std::string
    {
        static constexpr std::string_view file_scheme = "file://";
        if (path.starts_with('/'))
        {
            return std::string(file_scheme).append(path);
        }
        // Windows drive letter path
        std::string out(file_scheme);
        out += '/';
        for (const char c : path)
        {
            out += (c == '\\') ? '/' : c;
        }
        return out;
    }

    auto normalize_base_url(std::string_view url) -> std::string
    {
        auto out = std::string(rstrip(strip(url), '/'));
        out += '/';
        return out;
    }
}
