// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "mirrorfetch/core/logging.hpp"
#include "mirrorfetch/core/util.hpp"
#include "mirrorfetch/util/url_manip.hpp"

#include "curl.hpp"

namespace mirrorfetch::download
{
    namespace
    {
        void ensure_curl_initialized()
        {
            static std::once_flag init_flag;
            std::call_once(
                init_flag,
                []()
                {
                    const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
                    if (code != CURLE_OK)
                    {
                        throw curl_error(
                            fmt::format("curl: global initialization failed: {}", curl_easy_strerror(code))
                        );
                    }
                }
            );
        }

        std::size_t drop_body(char*, std::size_t size, std::size_t nmemb, void*)
        {
            return size * nmemb;
        }

        constexpr long http_method_not_allowed = 405;
    }

    namespace curl
    {
        std::optional<std::string> proxy_match(const std::string& url, const proxy_map_type& proxies)
        {
            if (proxies.empty())
            {
                return std::nullopt;
            }

            const std::string scheme = util::url_get_scheme(url);
            const std::string host = util::url_get_host(url);

            std::vector<std::string> keys;
            if (!host.empty())
            {
                keys.push_back(fmt::format("{}://{}", scheme, host));
            }
            keys.push_back(scheme);
            if (!host.empty())
            {
                keys.push_back(fmt::format("all://{}", host));
            }
            keys.push_back("all");

            for (const auto& key : keys)
            {
                if (const auto it = proxies.find(key); it != proxies.end())
                {
                    return it->second;
                }
            }
            return std::nullopt;
        }

        void configure_curl_handle(CURL* handle, const std::string& url, const RemoteFetchParams& params)
        {
            curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
            curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(handle, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);

            const std::string user_agent = fmt::format("{} {}", params.user_agent, curl_version());
            curl_easy_setopt(handle, CURLOPT_USERAGENT, user_agent.c_str());

            // Larger buffers give a better throughput, see https://github.com/curl/curl/issues/9601
            curl_easy_setopt(handle, CURLOPT_BUFFERSIZE, 100 * 1024L);

            // No CURLOPT_TIMEOUT: a large file on a slow but healthy mirror is fine.
            curl_easy_setopt(
                handle,
                CURLOPT_CONNECTTIMEOUT_MS,
                static_cast<long>(params.connect_timeout_secs * 1000.)
            );
            if (params.low_speed_limit > 0 && params.low_speed_time_secs > 0)
            {
                curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, params.low_speed_limit);
                curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, params.low_speed_time_secs);
            }

            const auto proxy = proxy_match(url, params.proxy_servers);
            if (proxy.has_value())
            {
                curl_easy_setopt(handle, CURLOPT_PROXY, proxy->c_str());
                LOG_INFO << "Using proxy " << logging::hide_secrets(*proxy);
            }

            if (params.ssl_no_revoke)
            {
                curl_easy_setopt(handle, CURLOPT_SSL_OPTIONS, CURLSSLOPT_NO_REVOKE);
            }

            const std::string& ssl_verify = params.ssl_verify;
            if (ssl_verify.empty() || ssl_verify == "<system>")
            {
                return;
            }
            if (ssl_verify == "<false>")
            {
                curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 0L);
                curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 0L);
                if (proxy.has_value())
                {
                    curl_easy_setopt(handle, CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
                    curl_easy_setopt(handle, CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
                }
                return;
            }
            if (!fs::exists(ssl_verify))
            {
                throw curl_error(fmt::format("ssl_verify is not a valid path: {}", ssl_verify));
            }
            const CURLoption ca_option = fs::is_directory(ssl_verify) ? CURLOPT_CAPATH : CURLOPT_CAINFO;
            curl_easy_setopt(handle, ca_option, ssl_verify.c_str());
            if (proxy.has_value())
            {
                curl_easy_setopt(handle, CURLOPT_PROXY_CAINFO, ssl_verify.c_str());
            }
        }

        bool check_resource_exists(const std::string& url, const RemoteFetchParams& params)
        {
            CURLHandle handle;
            handle.configure_handle(url, params);
            handle.set_opt(CURLOPT_FAILONERROR, 1L).set_opt(CURLOPT_NOBODY, 1L);

            if (handle.perform() == CURLE_OK)
            {
                return true;
            }

            const auto status = handle.get_info<int>(CURLINFO_RESPONSE_CODE);
            if (!status || *status != http_method_not_allowed)
            {
                return false;
            }

            LOG_DEBUG << "HEAD not allowed on " << logging::hide_secrets(url) << ", trying GET";
            handle.set_opt(CURLOPT_NOBODY, 0L)
                .set_opt(CURLOPT_HTTPGET, 1L)
                .set_opt(CURLOPT_WRITEFUNCTION, &drop_body);
            return handle.perform() == CURLE_OK;
        }

        std::string error_message(CURLcode code)
        {
            return curl_easy_strerror(code);
        }
    }

    /**********
     * CURLId *
     **********/

    CURLId::CURLId(CURL* handle)
        : p_handle(handle)
    {
    }

    std::size_t CURLId::hash() const noexcept
    {
        return std::hash<CURL*>{}(p_handle);
    }

    /**************
     * CURLHandle *
     **************/

    CURLHandle::CURLHandle()
    {
        ensure_curl_initialized();
        p_handle = curl_easy_init();
        if (p_handle == nullptr)
        {
            throw curl_error("curl: could not create an easy handle");
        }
        attach_error_buffer();
    }

    CURLHandle::~CURLHandle()
    {
        if (p_handle != nullptr)
        {
            curl_easy_cleanup(p_handle);
        }
    }

    CURLHandle::CURLHandle(CURLHandle&& rhs) noexcept
        : p_handle(std::exchange(rhs.p_handle, nullptr))
        , m_errorbuffer(rhs.m_errorbuffer)
    {
        // The buffer is owned by this object now, curl must write to the new address.
        if (p_handle != nullptr)
        {
            attach_error_buffer();
        }
    }

    CURLHandle& CURLHandle::operator=(CURLHandle&& rhs) noexcept
    {
        if (this != &rhs)
        {
            if (p_handle != nullptr)
            {
                curl_easy_cleanup(p_handle);
            }
            p_handle = std::exchange(rhs.p_handle, nullptr);
            m_errorbuffer = rhs.m_errorbuffer;
            if (p_handle != nullptr)
            {
                attach_error_buffer();
            }
        }
        return *this;
    }

    void CURLHandle::attach_error_buffer()
    {
        m_errorbuffer.fill('\0');
        curl_easy_setopt(p_handle, CURLOPT_ERRORBUFFER, m_errorbuffer.data());
    }

    void CURLHandle::configure_handle(const std::string& url, const RemoteFetchParams& params)
    {
        curl::configure_curl_handle(p_handle, url, params);
    }

    void CURLHandle::reset_handle()
    {
        curl_easy_reset(p_handle);
        attach_error_buffer();
    }

    CURLcode CURLHandle::perform()
    {
        return curl_easy_perform(p_handle);
    }

    std::string CURLHandle::effective_url() const
    {
        return get_info<std::string>(CURLINFO_EFFECTIVE_URL).value_or("");
    }

    std::string CURLHandle::error_details() const
    {
        return std::string(m_errorbuffer.data());
    }

    CURLId CURLHandle::get_id() const
    {
        return CURLId(p_handle);
    }

    /*******************
     * CURLMultiHandle *
     *******************/

    CURLMultiHandle::CURLMultiHandle(std::size_t max_connections)
    {
        ensure_curl_initialized();
        p_handle = curl_multi_init();
        if (p_handle == nullptr)
        {
            throw curl_error("curl: could not create a multi handle");
        }
        curl_multi_setopt(p_handle, CURLMOPT_MAX_TOTAL_CONNECTIONS, static_cast<long>(max_connections));
    }

    CURLMultiHandle::~CURLMultiHandle()
    {
        curl_multi_cleanup(p_handle);
    }

    void CURLMultiHandle::add_handle(const CURLHandle& handle)
    {
        const CURLMcode code = curl_multi_add_handle(p_handle, handle.p_handle);
        if (code != CURLM_OK && code != CURLM_CALL_MULTI_PERFORM)
        {
            throw curl_error(fmt::format("curl: could not add a transfer: {}", curl_multi_strerror(code)));
        }
    }

    void CURLMultiHandle::remove_handle(const CURLHandle& handle)
    {
        const CURLMcode code = curl_multi_remove_handle(p_handle, handle.p_handle);
        if (code != CURLM_OK)
        {
            LOG_WARNING << "curl: could not remove a transfer: " << curl_multi_strerror(code);
        }
    }

    std::size_t CURLMultiHandle::perform()
    {
        int running = 0;
        const CURLMcode code = curl_multi_perform(p_handle, &running);
        if (code != CURLM_OK)
        {
            throw curl_error(fmt::format("curl: {}", curl_multi_strerror(code)));
        }
        return static_cast<std::size_t>(running);
    }

    std::optional<CURLMultiResponse> CURLMultiHandle::pop_finished()
    {
        int remaining = 0;
        while (CURLMsg* msg = curl_multi_info_read(p_handle, &remaining))
        {
            if (msg->msg == CURLMSG_DONE)
            {
                return CURLMultiResponse{ CURLId(msg->easy_handle), msg->data.result };
            }
        }
        return std::nullopt;
    }

    std::size_t CURLMultiHandle::get_timeout(std::size_t max_timeout) const
    {
        long timeout = -1;
        const CURLMcode code = curl_multi_timeout(p_handle, &timeout);
        if (code != CURLM_OK)
        {
            throw curl_error(fmt::format("curl: {}", curl_multi_strerror(code)));
        }
        if (timeout < 0 || static_cast<std::size_t>(timeout) > max_timeout)
        {
            return max_timeout;
        }
        return static_cast<std::size_t>(timeout);
    }

    void CURLMultiHandle::wait(std::size_t timeout)
    {
        const CURLMcode code = curl_multi_wait(p_handle, nullptr, 0, static_cast<int>(timeout), nullptr);
        if (code != CURLM_OK)
        {
            throw curl_error(fmt::format("curl: {}", curl_multi_strerror(code)));
        }
    }
}
