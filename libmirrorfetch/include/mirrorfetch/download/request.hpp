// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_DOWNLOAD_REQUEST_HPP
#define MIRRORFETCH_DOWNLOAD_REQUEST_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "mirrorfetch/core/util.hpp"

namespace mirrorfetch::download
{
    /*******************************
     * Transfer results structures *
     *******************************/

    struct TransferData
    {
        int http_status = 0;
        std::string effective_url = "";
        std::size_t downloaded_size = 0;
        std::size_t average_speed_Bps = 0;
    };

    // Why a single transfer attempt did not complete.
    enum class FailureCause
    {
        not_found,
        timeout,
        connection_reset,
        server_error,
        client_error,
        rate_limited,
        range_not_satisfiable,
        size_mismatch,
        resource_changed,
        filesystem,
    };

    // What the caller is told about a failed task.
    enum class ErrorKind
    {
        not_found,
        transient,
        rate_limited,
        integrity_mismatch,
        exhausted,
        fatal,
    };

    [[nodiscard]] auto error_kind(FailureCause cause) -> ErrorKind;
    [[nodiscard]] auto to_string(FailureCause cause) -> std::string_view;
    [[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

    // The destination holds the whole resource.
    struct Completed
    {
        std::string filename = "";
        std::size_t total_size = 0;
        // Offset of the range request, 0 for a full transfer.
        std::size_t resumed_from = 0;
        TransferData transfer = {};
    };

    // The transfer stopped midway, the bytes already written stay on disk and a
    // later transfer resumes from there.
    struct Partial
    {
        std::size_t bytes_on_disk = 0;
        std::size_t resumed_from = 0;
        bool cancelled = false;
        std::string message = "";
        std::optional<TransferData> transfer = std::nullopt;
    };

    struct Error
    {
        FailureCause cause = FailureCause::connection_reset;
        std::string message = "";
        std::optional<std::size_t> retry_wait_seconds = std::nullopt;
        std::optional<TransferData> transfer = std::nullopt;
        // Size of the destination file after the attempt.
        std::size_t bytes_on_disk = 0;
    };

    using TransferOutcome = std::variant<Completed, Partial, Error>;

    /*****************************
     * Transfer event structures *
     *****************************/

    struct Progress
    {
        // Counted from the start of the resource, resumed bytes included.
        std::size_t downloaded_size = 0;
        std::size_t total_to_download = 0;
        std::size_t speed_Bps = 0;
    };

    using Event = std::variant<Progress, Error, Partial, Completed>;

    /*******************************
     * Transfer request structures *
     *******************************/

    struct TransferRequest
    {
        using progress_callback_t = std::function<void(const Event&)>;

        std::string url;
        fs::path filename;
        std::optional<std::size_t> expected_size = std::nullopt;
        std::optional<progress_callback_t> progress = std::nullopt;
    };

    enum class TaskStatus
    {
        pending,
        in_flight,
        paused,
        completed,
        failed,
    };

    [[nodiscard]] auto to_string(TaskStatus status) -> std::string_view;

    // One identifier to destination transfer, tracked through its own state machine.
    // ``url_path`` is the canonical path of the resource on any mirror, as given
    // by the catalog.
    struct TransferTask
    {
        std::string identifier;
        std::string url_path;
        fs::path destination_path;
        std::optional<std::size_t> expected_size = std::nullopt;
        // Higher is dispatched first.
        int priority = 0;

        std::size_t bytes_transferred = 0;
        TaskStatus status = TaskStatus::pending;
        std::size_t attempt_count = 0;
        std::optional<std::string> last_mirror_tried = std::nullopt;
    };

    struct TaskError
    {
        ErrorKind kind = ErrorKind::fatal;
        std::string reason = "";
    };

    struct TaskResult
    {
        std::string identifier;
        fs::path destination;
        // completed, paused or failed
        TaskStatus status = TaskStatus::failed;
        std::size_t bytes_transferred = 0;
        std::size_t attempt_count = 0;
        std::optional<std::string> last_mirror_tried = std::nullopt;
        std::optional<TaskError> error = std::nullopt;
        // A partial file is left on disk: a later download continues rather than restarts.
        bool resumable = false;
    };

    struct BatchResult
    {
        // In submission order.
        std::vector<TaskResult> results;
        // A fatal error halted the batch.
        bool halted = false;
        // The batch was cancelled by the caller or by a signal.
        bool cancelled = false;

        [[nodiscard]] std::size_t count(TaskStatus status) const;
        [[nodiscard]] bool all_completed() const;
    };
}

#endif
