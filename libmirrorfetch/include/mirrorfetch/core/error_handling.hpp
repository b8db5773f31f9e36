// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_CORE_ERROR_HANDLING_HPP
#define MIRRORFETCH_CORE_ERROR_HANDLING_HPP

#include <stdexcept>
#include <string>

#include <tl/expected.hpp>

namespace mirrorfetch
{

    /**************************
     * mirrorfetch exceptions *
     **************************/

    enum class mirrorfetch_error_code
    {
        unknown,
        configuration_error,
        registry_io,
    };

    class mirrorfetch_error : public std::runtime_error
    {
    public:

        using base_type = std::runtime_error;

        mirrorfetch_error(const std::string& msg, mirrorfetch_error_code ec);
        mirrorfetch_error(const char* msg, mirrorfetch_error_code ec);

        mirrorfetch_error_code error_code() const noexcept;

    private:

        mirrorfetch_error_code m_error_code;
    };

    /********************************
     * wrappers around tl::expected *
     ********************************/

    template <class T, class E = mirrorfetch_error>
    using expected_t = tl::expected<T, E>;

    tl::unexpected<mirrorfetch_error> make_unexpected(const char* msg, mirrorfetch_error_code ec);

    tl::unexpected<mirrorfetch_error>
    make_unexpected(const std::string& msg, mirrorfetch_error_code ec);

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp);

    /***********************************
     * helper functions implementation *
     ***********************************/

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp)
    {
        return tl::make_unexpected(exp.error());
    }
}

#endif
