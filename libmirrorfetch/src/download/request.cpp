// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include "mirrorfetch/download/request.hpp"

namespace mirrorfetch::download
{
    auto error_kind(FailureCause cause) -> ErrorKind
    {
        switch (cause)
        {
            case FailureCause::not_found:
                return ErrorKind::not_found;
            case FailureCause::timeout:
            case FailureCause::connection_reset:
            case FailureCause::server_error:
            case FailureCause::client_error:
            case FailureCause::range_not_satisfiable:
                return ErrorKind::transient;
            case FailureCause::rate_limited:
                return ErrorKind::rate_limited;
            case FailureCause::size_mismatch:
            case FailureCause::resource_changed:
                return ErrorKind::integrity_mismatch;
            case FailureCause::filesystem:
                return ErrorKind::fatal;
        }
        return ErrorKind::fatal;
    }

    auto to_string(FailureCause cause) -> std::string_view
    {
        switch (cause)
        {
            case FailureCause::not_found:
                return "not found";
            case FailureCause::timeout:
                return "timeout";
            case FailureCause::connection_reset:
                return "connection reset";
            case FailureCause::server_error:
                return "server error";
            case FailureCause::client_error:
                return "client error";
            case FailureCause::rate_limited:
                return "rate limited";
            case FailureCause::range_not_satisfiable:
                return "range not satisfiable";
            case FailureCause::size_mismatch:
                return "size mismatch";
            case FailureCause::resource_changed:
                return "resource changed";
            case FailureCause::filesystem:
                return "filesystem error";
        }
        return "unknown";
    }

    auto to_string(ErrorKind kind) -> std::string_view
    {
        switch (kind)
        {
            case ErrorKind::not_found:
                return "NotFound";
            case ErrorKind::transient:
                return "Transient";
            case ErrorKind::rate_limited:
                return "RateLimited";
            case ErrorKind::integrity_mismatch:
                return "IntegrityMismatch";
            case ErrorKind::exhausted:
                return "Exhausted";
            case ErrorKind::fatal:
                return "Fatal";
        }
        return "Fatal";
    }

    auto to_string(TaskStatus status) -> std::string_view
    {
        switch (status)
        {
            case TaskStatus::pending:
                return "pending";
            case TaskStatus::in_flight:
                return "in-flight";
            case TaskStatus::paused:
                return "paused";
            case TaskStatus::completed:
                return "completed";
            case TaskStatus::failed:
                return "failed";
        }
        return "unknown";
    }

    std::size_t BatchResult::count(TaskStatus status) const
    {
        return static_cast<std::size_t>(std::count_if(
            results.cbegin(),
            results.cend(),
            [status](const TaskResult& r) { return r.status == status; }
        ));
    }

    bool BatchResult::all_completed() const
    {
        return count(TaskStatus::completed) == results.size();
    }
}
