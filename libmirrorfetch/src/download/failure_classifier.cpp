// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include "mirrorfetch/core/logging.hpp"
#include "mirrorfetch/download/failure_classifier.hpp"
#include "mirrorfetch/download/mirror_registry.hpp"

namespace mirrorfetch::download
{
    namespace
    {
        // Keeps the exponential backoff in a sane range.
        constexpr std::chrono::seconds max_backoff_delay{ 300 };

        template <class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;
    }

    auto to_string(Decision decision) -> std::string_view
    {
        switch (decision)
        {
            case Decision::retry_same_mirror:
                return "retry-same-mirror";
            case Decision::retry_different_mirror:
                return "retry-different-mirror";
            case Decision::pause_for_resume:
                return "pause-for-resume";
            case Decision::fatal:
                return "fatal";
        }
        return "fatal";
    }

    FailureClassifier::FailureClassifier(const RemoteFetchParams& params)
        : m_max_retries(static_cast<std::size_t>(std::max(params.max_retries, 0)))
        , m_retry_timeout(std::max(params.retry_timeout, 0))
        , m_retry_backoff(std::max(params.retry_backoff, 1))
    {
    }

    Classification FailureClassifier::classify(const Error& error, std::size_t same_mirror_retries) const
    {
        const bool can_retry_same = same_mirror_retries < m_max_retries;
        Classification res;

        switch (error.cause)
        {
            case FailureCause::not_found:
                res.decision = Decision::retry_different_mirror;
                res.penalty = FailureSeverity::minor;
                res.mark_absent = true;
                break;
            case FailureCause::timeout:
            case FailureCause::connection_reset:
                res.penalty = FailureSeverity::moderate;
                if (can_retry_same)
                {
                    res.decision = Decision::retry_same_mirror;
                    res.delay = backoff_delay(same_mirror_retries);
                }
                else
                {
                    res.decision = Decision::retry_different_mirror;
                }
                break;
            case FailureCause::server_error:
                res.decision = Decision::retry_different_mirror;
                res.penalty = FailureSeverity::moderate;
                break;
            case FailureCause::client_error:
                res.decision = Decision::retry_different_mirror;
                res.penalty = FailureSeverity::minor;
                break;
            case FailureCause::rate_limited:
                // A single minor step, however long the mirror keeps rate limiting us.
                res.penalty = same_mirror_retries == 0 ? std::optional(FailureSeverity::minor)
                                                       : std::nullopt;
                res.mark_unavailable = true;
                res.delay = error.retry_wait_seconds.has_value()
                                ? std::chrono::seconds(error.retry_wait_seconds.value())
                                : backoff_delay(same_mirror_retries);
                // A wait longer than the backoff cap is not worth it: the mirror stays
                // out of the selection for that long and the task moves on.
                res.decision = can_retry_same && res.delay <= max_backoff_delay
                                   ? Decision::retry_same_mirror
                                   : Decision::retry_different_mirror;
                break;
            case FailureCause::range_not_satisfiable:
                res.decision = Decision::retry_same_mirror;
                res.discard_partial = true;
                break;
            case FailureCause::size_mismatch:
            case FailureCause::resource_changed:
                res.decision = Decision::retry_different_mirror;
                res.penalty = FailureSeverity::severe;
                res.discard_partial = true;
                break;
            case FailureCause::filesystem:
                res.decision = Decision::fatal;
                res.abort_batch = true;
                break;
        }
        return res;
    }

    Classification FailureClassifier::classify(const Partial& partial, std::size_t same_mirror_retries) const
    {
        Classification res;
        res.decision = Decision::pause_for_resume;
        if (!partial.cancelled)
        {
            res.penalty = FailureSeverity::minor;
            res.delay = backoff_delay(same_mirror_retries);
        }
        return res;
    }

    std::optional<Classification>
    FailureClassifier::classify(const TransferOutcome& outcome, std::size_t same_mirror_retries) const
    {
        return std::visit(
            overloaded{
                [](const Completed&) -> std::optional<Classification> { return std::nullopt; },
                [&](const Partial& p) -> std::optional<Classification>
                { return classify(p, same_mirror_retries); },
                [&](const Error& e) -> std::optional<Classification>
                { return classify(e, same_mirror_retries); },
            },
            outcome
        );
    }

    void FailureClassifier::apply(
        const Classification& classification,
        MirrorRegistry& registry,
        std::string_view mirror,
        std::string_view identifier,
        std::string_view message
    ) const
    {
        if (classification.mark_absent)
        {
            registry.mark_absent(mirror, identifier);
        }
        if (classification.penalty.has_value())
        {
            registry.report_failure(mirror, classification.penalty.value(), message);
        }
        if (classification.mark_unavailable)
        {
            registry.mark_unavailable_for(mirror, classification.delay);
        }
    }

    std::chrono::seconds FailureClassifier::backoff_delay(std::size_t retries) const
    {
        long long delay = m_retry_timeout;
        for (std::size_t i = 0; i < retries && delay < max_backoff_delay.count(); ++i)
        {
            delay *= m_retry_backoff;
        }
        return std::min(std::chrono::seconds(delay), max_backoff_delay);
    }

    std::size_t FailureClassifier::max_same_mirror_retries() const
    {
        return m_max_retries;
    }
}
