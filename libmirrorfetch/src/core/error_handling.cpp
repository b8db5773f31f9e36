// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "mirrorfetch/core/error_handling.hpp"

namespace mirrorfetch
{
    mirrorfetch_error::mirrorfetch_error(const std::string& msg, mirrorfetch_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    mirrorfetch_error::mirrorfetch_error(const char* msg, mirrorfetch_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    mirrorfetch_error_code mirrorfetch_error::error_code() const noexcept
    {
        return m_error_code;
    }

    tl::unexpected<mirrorfetch_error> make_unexpected(const char* msg, mirrorfetch_error_code ec)
    {
        return tl::make_unexpected(mirrorfetch_error(msg, ec));
    }

    tl::unexpected<mirrorfetch_error>
    make_unexpected(const std::string& msg, mirrorfetch_error_code ec)
    {
        return tl::make_unexpected(mirrorfetch_error(msg, ec));
    }
}
