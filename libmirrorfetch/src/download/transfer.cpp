// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cerrno>
#include <cstring>
#include <sstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "mirrorfetch/core/logging.hpp"
#include "mirrorfetch/core/thread_utils.hpp"
#include "mirrorfetch/download/transfer.hpp"
#include "mirrorfetch/util/string.hpp"
#include "mirrorfetch/util/url_manip.hpp"

#include "downloader_impl.hpp"

namespace mirrorfetch::download
{
    namespace http
    {
        static constexpr int NOT_FOUND = 404;
        static constexpr int GONE = 410;
        static constexpr int RANGE_NOT_SATISFIABLE = 416;
        static constexpr int TOO_MANY_REQUESTS = 429;
        static constexpr int INTERNAL_SERVER_ERROR = 500;
    }

    namespace
    {
        // Note: http_status == 0 for files
        bool is_http_status_ok(int http_status)
        {
            return http_status / 100 == 2 || http_status == 0;
        }

        void remove_file(const fs::path& path)
        {
            std::error_code ec;
            fs::remove(path, ec);
            if (ec)
            {
                LOG_WARNING << "Could not remove " << path << ": " << ec.message();
            }
        }

        Error filesystem_error(const fs::path& path, std::string_view what, const std::error_code& ec)
        {
            Error error;
            error.cause = FailureCause::filesystem;
            error.message = fmt::format("{} {}: {}", what, path.string(), ec.message());
            return error;
        }
    }

    /***************************
     * Destination preparation *
     ***************************/

    Preparation prepare_destination(const TransferRequest& request)
    {
        const fs::path& path = request.filename;
        std::error_code ec;
        if (path.has_parent_path())
        {
            fs::create_directories(path.parent_path(), ec);
            if (ec)
            {
                return filesystem_error(path.parent_path(), "Could not create directory", ec);
            }
        }

        const auto existing_size = regular_file_size(path);
        if (!existing_size.has_value())
        {
            if (fs::exists(fs::symlink_status(path, ec)))
            {
                return filesystem_error(path, "Destination is not a regular file", std::error_code());
            }
            return StartPoint{ 0 };
        }

        const std::size_t size = existing_size.value();
        if (!request.expected_size.has_value())
        {
            // The server tells if there is nothing left to fetch.
            return StartPoint{ size };
        }

        const std::size_t expected = request.expected_size.value();
        if (size == expected)
        {
            LOG_DEBUG << "Destination " << path << " already complete (" << size << " bytes)";
            return Completed{ path.string(), size, size, {} };
        }
        if (size > expected)
        {
            LOG_INFO << "Discarding stale partial file " << path << " (" << size << " bytes, "
                     << expected << " expected)";
            fs::remove(path, ec);
            if (ec)
            {
                return filesystem_error(path, "Could not remove stale partial file", ec);
            }
            return StartPoint{ 0 };
        }
        return StartPoint{ size };
    }

    /**********************************
     * TransferAttempt implementation *
     **********************************/

    TransferAttempt::TransferAttempt(
        CURLHandle& handle,
        const TransferRequest& request,
        StartPoint start,
        CURLMultiHandle& downloader,
        const RemoteFetchParams& params,
        bool verbose,
        stop_predicate should_stop,
        on_finish_callback on_finish
    )
        : p_impl(std::make_unique<Impl>(
              handle,
              request,
              start,
              downloader,
              params,
              verbose,
              std::move(should_stop),
              std::move(on_finish)
          ))
    {
    }

    auto TransferAttempt::create_completion_function() -> completion_function
    {
        return [impl = p_impl.get()](CURLMultiHandle& handle, CURLcode code)
        { return impl->finish_transfer(handle, code); };
    }

    TransferAttempt::Impl::Impl(
        CURLHandle& handle,
        const TransferRequest& request,
        StartPoint start,
        CURLMultiHandle& downloader,
        const RemoteFetchParams& params,
        bool verbose,
        stop_predicate should_stop,
        on_finish_callback on_finish
    )
        : p_handle(&handle)
        , p_request(&request)
        , m_should_stop(std::move(should_stop))
        , m_on_finish(std::move(on_finish))
        , m_offset(start.offset)
        , m_bytes_on_disk(start.offset)
    {
        configure_handle(params, verbose);
        downloader.add_handle(*p_handle);
    }

    bool TransferAttempt::Impl::finish_transfer(CURLMultiHandle& downloader, CURLcode code)
    {
        if (m_file.is_open())
        {
            m_file.close();
        }
        TransferOutcome outcome = build_outcome(code);
        clean_attempt(downloader);
        invoke_progress_callback(std::visit([](const auto& res) -> Event { return res; }, outcome));
        return m_on_finish(std::move(outcome));
    }

    void TransferAttempt::Impl::clean_attempt(CURLMultiHandle& downloader)
    {
        downloader.remove_handle(*p_handle);
        p_handle->reset_handle();
    }

    void TransferAttempt::Impl::discard_partial_file()
    {
        if (m_file.is_open())
        {
            m_file.close();
        }
        remove_file(p_request->filename);
        m_bytes_on_disk = 0;
    }

    void TransferAttempt::Impl::invoke_progress_callback(const Event& event) const
    {
        if (p_request->progress.has_value())
        {
            p_request->progress.value()(event);
        }
    }

    namespace
    {
        int
        curl_debug_callback(CURL* /* handle */, curl_infotype type, char* data, size_t size, void* userptr)
        {
            auto* logger = reinterpret_cast<spdlog::logger*>(userptr);
            if (logger == nullptr)
            {
                return 0;
            }
            auto log = logging::hide_secrets(std::string_view(data, size));
            switch (type)
            {
                case CURLINFO_TEXT:
                    logger->info(fmt::format("* {}", log));
                    break;
                case CURLINFO_HEADER_OUT:
                    logger->info(fmt::format("> {}", log));
                    break;
                case CURLINFO_HEADER_IN:
                    logger->info(fmt::format("< {}", log));
                    break;
                default:
                    break;
            }
            return 0;
        }

        std::string
        build_transfer_message(int http_status, const std::string& effective_url, std::size_t size)
        {
            std::stringstream ss;
            ss << "Transfer finalized, status: " << http_status << " [" << effective_url << "] "
               << size << " bytes";
            return ss.str();
        }
    }

    void TransferAttempt::Impl::configure_handle(const RemoteFetchParams& params, bool verbose)
    {
        p_handle->configure_handle(p_request->url, params);

        if (m_offset > 0)
        {
            // Sends "Range: bytes=<offset>-"
            p_handle->set_opt(CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(m_offset));
        }

        p_handle->set_opt(CURLOPT_HEADERFUNCTION, &TransferAttempt::Impl::curl_header_callback);
        p_handle->set_opt(CURLOPT_HEADERDATA, this);

        p_handle->set_opt(CURLOPT_WRITEFUNCTION, &TransferAttempt::Impl::curl_write_callback);
        p_handle->set_opt(CURLOPT_WRITEDATA, this);

        // Always on: cancellation is checked between two network operations.
        p_handle->set_opt(CURLOPT_XFERINFOFUNCTION, &TransferAttempt::Impl::curl_progress_callback);
        p_handle->set_opt(CURLOPT_XFERINFODATA, this);
        p_handle->set_opt(CURLOPT_NOPROGRESS, 0L);

        p_handle->set_opt(CURLOPT_VERBOSE, verbose);

        auto logger = spdlog::get(std::string(logging::curl_logger_name));
        p_handle->set_opt(CURLOPT_DEBUGFUNCTION, curl_debug_callback);
        p_handle->set_opt(CURLOPT_DEBUGDATA, logger.get());
    }

    bool TransferAttempt::Impl::open_file(std::ios::openmode mode)
    {
        m_file = open_ofstream(p_request->filename, std::ios::out | std::ios::binary | mode);
        if (!m_file)
        {
            LOG_ERROR << "Could not open file for download " << p_request->filename << ": "
                      << strerror(errno);
            return false;
        }
        return true;
    }

    std::size_t TransferAttempt::Impl::write_data(char* buffer, std::size_t size)
    {
        // Returning a size different from the one received aborts the transfer.
        // Nothing of the current chunk is written in that case.
        if (m_should_stop && m_should_stop())
        {
            m_cancelled = true;
            return 0;
        }

        if (!is_http_status_ok(m_header_status))
        {
            // Error page, not part of the resource
            return size;
        }

        const auto& expected = p_request->expected_size;
        if (expected.has_value() && m_content_range_total.has_value()
            && m_content_range_total.value() != expected.value())
        {
            m_abort_cause = FailureCause::resource_changed;
            return 0;
        }
        if (expected.has_value() && m_bytes_on_disk + size > expected.value())
        {
            m_abort_cause = FailureCause::size_mismatch;
            return 0;
        }

        if (!m_file.is_open() && !open_file(m_offset > 0 ? std::ios::app : std::ios::trunc))
        {
            m_abort_cause = FailureCause::filesystem;
            return 0;
        }

        m_file.write(buffer, static_cast<std::streamsize>(size));
        m_file.flush();
        if (!m_file)
        {
            LOG_ERROR << "Could not write to file " << p_request->filename << ": " << strerror(errno);
            m_abort_cause = FailureCause::filesystem;
            return 0;
        }

        m_bytes_on_disk += size;
        m_written += size;

        if (p_request->progress.has_value())
        {
            const auto speed_Bps = p_handle->get_info<std::size_t>(CURLINFO_SPEED_DOWNLOAD_T)
                                       .value_or(0);
            const std::size_t total = expected.value_or(m_content_range_total.value_or(0));
            invoke_progress_callback(Progress{ m_bytes_on_disk, total, speed_Bps });
        }
        return size;
    }

    void TransferAttempt::Impl::parse_header(std::string_view header)
    {
        if (header.starts_with("HTTP/"))
        {
            // New response, e.g. after a redirection
            m_header_status = 0;
            m_content_range_total = std::nullopt;
            const auto space = header.find(' ');
            if (space != std::string_view::npos)
            {
                const auto code = util::strip(header.substr(space + 1, 3));
                m_header_status = static_cast<int>(util::parse_size(code).value_or(0));
            }
            return;
        }

        auto colon_idx = header.find(':');
        if (colon_idx == std::string_view::npos)
        {
            return;
        }

        // http headers are case insensitive!
        const std::string key = util::to_lower(header.substr(0, colon_idx));
        const std::string_view value = util::strip(header.substr(colon_idx + 1));
        if (key == "content-range")
        {
            // "bytes 100-499/500" or "bytes */500"
            const auto slash = value.rfind('/');
            if (slash != std::string_view::npos)
            {
                m_content_range_total = util::parse_size(value.substr(slash + 1));
            }
        }
    }

    size_t
    TransferAttempt::Impl::curl_header_callback(char* buffer, size_t size, size_t nbitems, void* self)
    {
        const size_t buffer_size = size * nbitems;
        reinterpret_cast<TransferAttempt::Impl*>(self)->parse_header(std::string_view(buffer, buffer_size));
        return buffer_size;
    }

    size_t
    TransferAttempt::Impl::curl_write_callback(char* buffer, size_t size, size_t nbitems, void* self)
    {
        return reinterpret_cast<TransferAttempt::Impl*>(self)->write_data(buffer, size * nbitems);
    }

    int TransferAttempt::Impl::curl_progress_callback(void* f, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
    {
        auto* self = reinterpret_cast<TransferAttempt::Impl*>(f);
        if (self->m_should_stop && self->m_should_stop())
        {
            self->m_cancelled = true;
            return 1;
        }
        return 0;
    }

    TransferData TransferAttempt::Impl::get_transfer_data() const
    {
        // Curl transforms file URI like file:///C/something into file://C/something, which
        // may lead to wrong comparisons later. When the URL is a file URI, we know there is
        // no redirection and we can use the input URL as the effective URL.
        std::string url = util::is_file_uri(p_request->url) ? p_request->url
                                                            : p_handle->effective_url();
        return {
            /* .http_status = */ p_handle->get_info<int>(CURLINFO_RESPONSE_CODE).value_or(0),
            /* .effective_url = */ std::move(url),
            /* .downloaded_size = */ p_handle->get_info<std::size_t>(CURLINFO_SIZE_DOWNLOAD_T).value_or(0),
            /* .average_speed = */ p_handle->get_info<std::size_t>(CURLINFO_SPEED_DOWNLOAD_T).value_or(0)
        };
    }

    Error TransferAttempt::Impl::build_error(
        FailureCause cause,
        std::string message,
        std::optional<TransferData> data
    ) const
    {
        Error error;
        error.cause = cause;
        error.message = std::move(message);
        error.transfer = std::move(data);
        error.bytes_on_disk = m_bytes_on_disk;
        return error;
    }

    Partial
    TransferAttempt::Impl::build_partial(bool cancelled, std::string message, std::optional<TransferData> data) const
    {
        return { /* .bytes_on_disk = */ m_bytes_on_disk,
                 /* .resumed_from = */ m_offset,
                 /* .cancelled = */ cancelled,
                 /* .message = */ std::move(message),
                 /* .transfer = */ std::move(data) };
    }

    TransferOutcome TransferAttempt::Impl::build_outcome(CURLcode code)
    {
        const std::string& url = p_request->url;
        if (m_abort_cause.has_value())
        {
            const FailureCause cause = m_abort_cause.value();
            std::string message;
            switch (cause)
            {
                case FailureCause::resource_changed:
                    message = fmt::format(
                        "Resource changed on server [{}]: {} bytes instead of {}",
                        url,
                        m_content_range_total.value_or(0),
                        p_request->expected_size.value_or(0)
                    );
                    discard_partial_file();
                    break;
                case FailureCause::size_mismatch:
                    message = fmt::format(
                        "Server sent more than the {} expected bytes [{}]",
                        p_request->expected_size.value_or(0),
                        url
                    );
                    discard_partial_file();
                    break;
                default:
                    message = fmt::format("Could not write to {}", p_request->filename.string());
                    break;
            }
            return build_error(cause, std::move(message));
        }

        if (m_cancelled || code == CURLE_ABORTED_BY_CALLBACK)
        {
            return build_partial(
                true,
                fmt::format("Transfer cancelled after {} bytes [{}]", m_bytes_on_disk, url)
            );
        }

        if (code != CURLE_OK)
        {
            const std::string message = fmt::format(
                "Transfer error ({}) {} [{}]\n{}",
                static_cast<int>(code),
                curl::error_message(code),
                url,
                p_handle->error_details()
            );
            switch (code)
            {
                case CURLE_RANGE_ERROR:
                case CURLE_BAD_DOWNLOAD_RESUME:
                    discard_partial_file();
                    return build_error(FailureCause::range_not_satisfiable, message);
                case CURLE_FILE_COULDNT_READ_FILE:
                case CURLE_REMOTE_FILE_NOT_FOUND:
                    return build_error(FailureCause::not_found, message);
                default:
                    break;
            }
            if (m_written > 0)
            {
                return build_partial(false, message, get_transfer_data());
            }
            return build_error(
                code == CURLE_OPERATION_TIMEDOUT ? FailureCause::timeout : FailureCause::connection_reset,
                message
            );
        }

        return build_outcome(get_transfer_data());
    }

    TransferOutcome TransferAttempt::Impl::build_outcome(TransferData data)
    {
        const int status = data.http_status;
        std::string message = build_transfer_message(status, data.effective_url, data.downloaded_size);

        if (status == http::RANGE_NOT_SATISFIABLE)
        {
            if (m_content_range_total.has_value() && m_content_range_total.value() == m_offset
                && p_request->expected_size.value_or(m_offset) == m_offset)
            {
                // The partial file already holds the whole resource
                return Completed{ p_request->filename.string(), m_offset, m_offset, std::move(data) };
            }
            discard_partial_file();
            return build_error(FailureCause::range_not_satisfiable, std::move(message), std::move(data));
        }
        if (status == http::NOT_FOUND || status == http::GONE)
        {
            return build_error(FailureCause::not_found, std::move(message), std::move(data));
        }
        if (status == http::TOO_MANY_REQUESTS)
        {
            Error error = build_error(FailureCause::rate_limited, std::move(message), data);
            if (const auto wait = p_handle->get_info<std::size_t>(CURLINFO_RETRY_AFTER);
                wait.has_value() && wait.value() > 0)
            {
                error.retry_wait_seconds = wait.value();
            }
            return error;
        }
        if (status >= http::INTERNAL_SERVER_ERROR)
        {
            return build_error(FailureCause::server_error, std::move(message), std::move(data));
        }
        if (!is_http_status_ok(status))
        {
            return build_error(FailureCause::client_error, std::move(message), std::move(data));
        }

        const auto expected = p_request->expected_size.has_value() ? p_request->expected_size
                                                                   : m_content_range_total;
        if (expected.has_value() && expected.value() != m_bytes_on_disk)
        {
            message = fmt::format(
                "Size mismatch for {}: {} bytes on disk, {} expected [{}]",
                p_request->filename.string(),
                m_bytes_on_disk,
                expected.value(),
                data.effective_url
            );
            discard_partial_file();
            return build_error(FailureCause::size_mismatch, std::move(message), std::move(data));
        }

        if (m_written == 0 && !fs::exists(p_request->filename))
        {
            // Empty resource
            if (!open_file(std::ios::trunc))
            {
                return build_error(
                    FailureCause::filesystem,
                    fmt::format("Could not write to {}", p_request->filename.string()),
                    std::move(data)
                );
            }
            m_file.close();
        }

        LOG_DEBUG << message;
        return Completed{ p_request->filename.string(), m_bytes_on_disk, m_offset, std::move(data) };
    }

    /******************************
     * Standalone transfer driver *
     ******************************/

    namespace
    {
        TransferOutcome run_single_attempt(
            const TransferRequest& request,
            StartPoint start,
            const RemoteFetchParams& params,
            const std::stop_token& stop_token
        )
        {
            CURLMultiHandle multi_handle(1);
            CURLHandle handle;
            std::optional<TransferOutcome> outcome;

            TransferAttempt attempt(
                handle,
                request,
                start,
                multi_handle,
                params,
                false,
                [&stop_token]() { return stop_token.stop_requested() || is_sig_interrupted(); },
                [&outcome](TransferOutcome res)
                {
                    outcome = std::move(res);
                    return false;
                }
            );
            auto completion = attempt.create_completion_function();

            while (!outcome.has_value())
            {
                const std::size_t still_running = multi_handle.perform();
                while (auto resp = multi_handle.pop_finished())
                {
                    if (resp->handle_id == handle.get_id())
                    {
                        completion(multi_handle, resp->result);
                    }
                }
                if (!outcome.has_value() && still_running > 0)
                {
                    multi_handle.wait(multi_handle.get_timeout(100));
                }
            }
            return std::move(outcome).value();
        }
    }

    TransferOutcome
    transfer(const TransferRequest& request, const RemoteFetchParams& params, std::stop_token stop_token)
    {
        Preparation preparation = prepare_destination(request);
        if (auto* done = std::get_if<Completed>(&preparation))
        {
            if (request.progress.has_value())
            {
                request.progress.value()(*done);
            }
            return std::move(*done);
        }
        if (auto* error = std::get_if<Error>(&preparation))
        {
            return std::move(*error);
        }

        const StartPoint start = std::get<StartPoint>(preparation);
        TransferOutcome outcome = run_single_attempt(request, start, params, stop_token);

        // A rejected range or a changed resource drops the partial file, start over once.
        const auto* error = std::get_if<Error>(&outcome);
        if (error != nullptr && start.offset > 0
            && (error->cause == FailureCause::range_not_satisfiable
                || error->cause == FailureCause::resource_changed))
        {
            LOG_INFO << "Restarting " << request.url << " from zero: " << error->message;
            outcome = run_single_attempt(request, StartPoint{ 0 }, params, stop_token);
        }
        return outcome;
    }

    TransferOutcome transfer(
        const std::string& url,
        const fs::path& destination,
        std::optional<std::size_t> expected_size,
        const RemoteFetchParams& params,
        std::stop_token stop_token
    )
    {
        return transfer(TransferRequest{ url, destination, expected_size }, params, std::move(stop_token));
    }
}
