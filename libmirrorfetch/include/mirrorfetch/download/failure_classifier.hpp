// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_DOWNLOAD_FAILURE_CLASSIFIER_HPP
#define MIRRORFETCH_DOWNLOAD_FAILURE_CLASSIFIER_HPP

#include <chrono>
#include <optional>
#include <string_view>

#include "mirrorfetch/download/mirror.hpp"
#include "mirrorfetch/download/parameters.hpp"
#include "mirrorfetch/download/request.hpp"

namespace mirrorfetch::download
{
    class MirrorRegistry;

    enum class Decision
    {
        retry_same_mirror,
        retry_different_mirror,
        pause_for_resume,
        fatal,
    };

    [[nodiscard]] auto to_string(Decision decision) -> std::string_view;

    struct Classification
    {
        Decision decision = Decision::fatal;
        std::optional<FailureSeverity> penalty = std::nullopt;
        bool mark_absent = false;
        // The mirror asked us to slow down, keep it out of the selection for ``delay``.
        bool mark_unavailable = false;
        bool discard_partial = false;
        bool abort_batch = false;
        std::chrono::seconds delay = std::chrono::seconds(0);
    };

    /**
     * Maps the outcome of a transfer attempt to the next step of the task,
     * and to the effect it has on the health of the mirror.
     */
    class FailureClassifier
    {
    public:

        explicit FailureClassifier(const RemoteFetchParams& params);

        /**
         * @param same_mirror_retries Number of retries already done on the mirror
         *        that produced ``error``.
         */
        [[nodiscard]] Classification classify(const Error& error, std::size_t same_mirror_retries) const;
        [[nodiscard]] Classification classify(const Partial& partial, std::size_t same_mirror_retries) const;

        /// Nothing to classify for a completed transfer.
        [[nodiscard]] std::optional<Classification>
        classify(const TransferOutcome& outcome, std::size_t same_mirror_retries) const;

        void apply(
            const Classification& classification,
            MirrorRegistry& registry,
            std::string_view mirror,
            std::string_view identifier,
            std::string_view message
        ) const;

        /// ``retry_timeout * retry_backoff ^ retries``
        [[nodiscard]] std::chrono::seconds backoff_delay(std::size_t retries) const;

        [[nodiscard]] std::size_t max_same_mirror_retries() const;

    private:

        std::size_t m_max_retries;
        int m_retry_timeout;
        int m_retry_backoff;
    };
}

#endif
