// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_DL_CURL_HPP
#define MIRRORFETCH_DL_CURL_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

extern "C"
{
#include <curl/curl.h>
}

#include <fmt/format.h>
#include <tl/expected.hpp>

#include "mirrorfetch/download/parameters.hpp"

namespace mirrorfetch::download
{
    class curl_error : public std::runtime_error
    {
    public:

        using std::runtime_error::runtime_error;
    };

    namespace curl
    {
        using proxy_map_type = std::map<std::string, std::string>;

        /**
         * Looks up the proxy for ``url``, from the most to the least specific key:
         * ``scheme://host``, ``scheme``, ``all://host``, ``all``.
         */
        std::optional<std::string> proxy_match(const std::string& url, const proxy_map_type& proxies);

        /**
         * Options shared by every request sent to a mirror: URL, user agent,
         * per operation timeouts, proxy and TLS verification.
         */
        void configure_curl_handle(CURL* handle, const std::string& url, const RemoteFetchParams& params);

        /**
         * HEAD request on ``url``, falling back on a GET when the server
         * does not allow HEAD.
         */
        bool check_resource_exists(const std::string& url, const RemoteFetchParams& params);

        std::string error_message(CURLcode code);
    }

    // Identifies an easy handle in the messages of the multi handle.
    class CURLId
    {
    public:

        bool operator==(const CURLId&) const = default;

        std::size_t hash() const noexcept;

    private:

        explicit CURLId(CURL* handle);

        CURL* p_handle;

        friend class CURLHandle;
        friend class CURLMultiHandle;
    };
}

template <>
struct std::hash<mirrorfetch::download::CURLId>
{
    std::size_t operator()(const mirrorfetch::download::CURLId& arg) const noexcept
    {
        return arg.hash();
    }
};

namespace mirrorfetch::download
{
    /**
     * Owns a curl easy handle and the error buffer attached to it.
     * The handle is reused by all the attempts of a task.
     */
    class CURLHandle
    {
    public:

        CURLHandle();
        ~CURLHandle();

        CURLHandle(const CURLHandle&) = delete;
        CURLHandle& operator=(const CURLHandle&) = delete;

        CURLHandle(CURLHandle&& rhs) noexcept;
        CURLHandle& operator=(CURLHandle&& rhs) noexcept;

        void configure_handle(const std::string& url, const RemoteFetchParams& params);

        // Back to a blank handle, ready for the next attempt.
        void reset_handle();

        template <class T>
        CURLHandle& set_opt(CURLoption opt, const T& val);

        /**
         * ``std::size_t`` reads a ``curl_off_t`` option, ``int`` a ``long`` one and
         * ``std::string`` a ``char*`` one.
         */
        template <class T>
        tl::expected<T, CURLcode> get_info(CURLINFO option) const;

        // Blocking transfer, outside of any multi handle.
        CURLcode perform();

        std::string effective_url() const;
        std::string error_details() const;

        CURLId get_id() const;

    private:

        void attach_error_buffer();

        CURL* p_handle = nullptr;
        std::array<char, CURL_ERROR_SIZE> m_errorbuffer = {};

        friend class CURLMultiHandle;
    };

    // A finished transfer.
    struct CURLMultiResponse
    {
        CURLId handle_id;
        CURLcode result;
    };

    /**
     * Drives the easy handles of the running transfers.
     */
    class CURLMultiHandle
    {
    public:

        explicit CURLMultiHandle(std::size_t max_connections);
        ~CURLMultiHandle();

        CURLMultiHandle(const CURLMultiHandle&) = delete;
        CURLMultiHandle& operator=(const CURLMultiHandle&) = delete;

        void add_handle(const CURLHandle& handle);
        void remove_handle(const CURLHandle& handle);

        /// Number of transfers still running.
        std::size_t perform();

        /// Next finished transfer, other messages are skipped.
        std::optional<CURLMultiResponse> pop_finished();

        /// Milliseconds to wait before the next ``perform``, at most ``max_timeout``.
        std::size_t get_timeout(std::size_t max_timeout = 1000u) const;
        void wait(std::size_t timeout);

    private:

        CURLM* p_handle = nullptr;
    };

    /**************************************
     * CURLHandle template implementation *
     **************************************/

    template <class T>
    CURLHandle& CURLHandle::set_opt(CURLoption opt, const T& val)
    {
        CURLcode code = CURLE_OK;
        if constexpr (std::is_same_v<T, std::string>)
        {
            code = curl_easy_setopt(p_handle, opt, val.c_str());
        }
        else if constexpr (std::is_same_v<T, bool>)
        {
            code = curl_easy_setopt(p_handle, opt, val ? 1L : 0L);
        }
        else
        {
            code = curl_easy_setopt(p_handle, opt, val);
        }
        if (code != CURLE_OK)
        {
            throw curl_error(fmt::format(
                "curl: could not set option {}: {}",
                static_cast<int>(opt),
                curl_easy_strerror(code)
            ));
        }
        return *this;
    }

    // curl_easy_getinfo writes through a pointer whose type depends on the option,
    // see https://curl.se/libcurl/c/curl_easy_getinfo.html
    template <class T>
    tl::expected<T, CURLcode> CURLHandle::get_info(CURLINFO option) const
    {
        if constexpr (std::is_same_v<T, std::string>)
        {
            char* val = nullptr;
            const CURLcode code = curl_easy_getinfo(p_handle, option, &val);
            if (code != CURLE_OK)
            {
                return tl::unexpected(code);
            }
            return val == nullptr ? std::string() : std::string(val);
        }
        else if constexpr (std::is_same_v<T, std::size_t>)
        {
            curl_off_t val = 0;
            const CURLcode code = curl_easy_getinfo(p_handle, option, &val);
            if (code != CURLE_OK)
            {
                return tl::unexpected(code);
            }
            return static_cast<std::size_t>(std::max<curl_off_t>(val, 0));
        }
        else
        {
            static_assert(std::is_same_v<T, int>, "Unsupported curl info type");
            long val = 0;
            const CURLcode code = curl_easy_getinfo(p_handle, option, &val);
            if (code != CURLE_OK)
            {
                return tl::unexpected(code);
            }
            return static_cast<int>(val);
        }
    }
}

#endif
