// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_DL_DOWNLOADER_IMPL_HPP
#define MIRRORFETCH_DL_DOWNLOADER_IMPL_HPP

#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <variant>

#include "mirrorfetch/download/downloader.hpp"
#include "mirrorfetch/download/failure_classifier.hpp"
#include "mirrorfetch/download/mirror_selector.hpp"

#include "curl.hpp"

namespace mirrorfetch::download
{
    /*
     * Destination inspection, done before any network request.
     */
    struct StartPoint
    {
        std::size_t offset = 0;
    };

    // Either where to start from, or the outcome of the transfer when no
    // network request is needed.
    using Preparation = std::variant<StartPoint, Completed, Error>;

    /**
     * Resumes a partial file smaller than the expected size, truncates a larger one,
     * and completes right away when the destination already has the expected size.
     */
    Preparation prepare_destination(const TransferRequest& request);

    /*
     * TransferAttempt
     *
     * A single request against a single URL, driven by the curl multi handle.
     */
    class TransferAttempt
    {
    public:

        using completion_function = std::function<bool(CURLMultiHandle&, CURLcode)>;
        using on_finish_callback = std::function<bool(TransferOutcome)>;
        using stop_predicate = std::function<bool()>;

        TransferAttempt() = default;

        TransferAttempt(
            CURLHandle& handle,
            const TransferRequest& request,
            StartPoint start,
            CURLMultiHandle& downloader,
            const RemoteFetchParams& params,
            bool verbose,
            stop_predicate should_stop,
            on_finish_callback on_finish
        );

        auto create_completion_function() -> completion_function;

    private:

        // This internal structure stored in an std::unique_ptr is required to guarantee
        // move semantics: the curl callbacks and the completion function capture
        // the current instance, therefore this latter must be stable in memory.
        struct Impl
        {
            Impl(
                CURLHandle& handle,
                const TransferRequest& request,
                StartPoint start,
                CURLMultiHandle& downloader,
                const RemoteFetchParams& params,
                bool verbose,
                stop_predicate should_stop,
                on_finish_callback on_finish
            );

            bool finish_transfer(CURLMultiHandle& downloader, CURLcode code);
            void clean_attempt(CURLMultiHandle& downloader);
            void discard_partial_file();
            void invoke_progress_callback(const Event&) const;

            void configure_handle(const RemoteFetchParams& params, bool verbose);

            std::size_t write_data(char* buffer, std::size_t size);
            void parse_header(std::string_view header);
            bool open_file(std::ios::openmode mode);

            static std::size_t curl_header_callback(char* buffer, std::size_t size, std::size_t nbitems, void* self);
            static std::size_t curl_write_callback(char* buffer, std::size_t size, std::size_t nbitems, void* self);
            static int curl_progress_callback(
                void* f,
                curl_off_t total_to_download,
                curl_off_t now_downloaded,
                curl_off_t,
                curl_off_t
            );

            TransferData get_transfer_data() const;
            TransferOutcome build_outcome(CURLcode code);
            TransferOutcome build_outcome(TransferData data);
            Error build_error(FailureCause cause, std::string message, std::optional<TransferData> data = std::nullopt) const;
            Partial build_partial(bool cancelled, std::string message, std::optional<TransferData> data = std::nullopt) const;

            CURLHandle* p_handle = nullptr;
            const TransferRequest* p_request = nullptr;
            stop_predicate m_should_stop;
            on_finish_callback m_on_finish;
            std::ofstream m_file;
            std::size_t m_offset = 0;
            std::size_t m_bytes_on_disk = 0;
            std::size_t m_written = 0;
            // Status of the last response header block, 0 until one is received.
            int m_header_status = 0;
            std::optional<std::size_t> m_content_range_total = std::nullopt;
            std::optional<FailureCause> m_abort_cause = std::nullopt;
            bool m_cancelled = false;
        };

        std::unique_ptr<Impl> p_impl = nullptr;
    };

    /*
     * TaskTracker
     *
     * Drives the attempts of one task, choosing a mirror for each of them
     * and deciding what happens after each outcome.
     */

    // Shared by all the trackers of a batch.
    struct TrackerEnvironment
    {
        MirrorRegistry* p_registry = nullptr;
        MirrorSelector* p_selector = nullptr;
        const FailureClassifier* p_classifier = nullptr;
        const RemoteFetchParams* p_params = nullptr;
        Monitor* p_monitor = nullptr;
        std::function<bool()> should_stop;
        std::function<void()> halt_batch;
        bool verbose = false;
    };

    class TaskTracker
    {
    public:

        using completion_function = TransferAttempt::completion_function;
        using completion_map_entry = std::pair<CURLId, completion_function>;
        using clock = std::chrono::steady_clock;

        TaskTracker(TransferTask& task, const TrackerEnvironment& env);

        /**
         * Returns nothing when the task was resolved without any network request.
         */
        auto prepare_new_attempt(CURLMultiHandle& handle) -> std::optional<completion_map_entry>;

        bool can_start_transfer() const;
        bool is_active() const;
        std::optional<clock::time_point> next_retry() const;

        // Called when the batch stops before this task reached a terminal state.
        void pause();

        TaskResult get_result() const;

    private:

        enum class State
        {
            WAITING,
            RUNNING,
            FINISHED,
            PAUSED,
            FAILED
        };

        bool on_transfer_finished(TransferOutcome outcome);
        void on_completed(const Completed& completed);
        void on_unfinished(const TransferOutcome& outcome, const Classification& classification);

        const MirrorSite* select_mirror();
        void switch_mirror();
        void set_failed(ErrorKind kind, std::string reason);
        void set_paused(std::string reason);
        void sync_bytes_on_disk();

        TransferTask* p_task;
        const TrackerEnvironment* p_env;
        CURLHandle m_handle;
        TransferRequest m_request;
        TransferAttempt m_attempt;

        State m_state = State::WAITING;
        std::optional<MirrorSite> m_mirror = std::nullopt;
        MirrorSelector::exclusion_set m_tried_mirrors;
        std::size_t m_same_mirror_retries = 0;
        std::optional<clock::time_point> m_next_retry = std::nullopt;
        std::optional<TaskError> m_error = std::nullopt;
    };

    class Downloader
    {
    public:

        Downloader(
            std::vector<TransferTask> tasks,
            MirrorRegistry& registry,
            const Context& context,
            Options options,
            Monitor* monitor
        );

        Downloader(const Downloader&) = delete;
        Downloader& operator=(const Downloader&) = delete;

        BatchResult download();

    private:

        void prepare_next_downloads();
        void update_downloads();
        void abort_running_transfers();
        void wait_next_retry() const;
        bool download_done() const;
        bool should_stop() const;
        void pause_remaining();
        void persist_registry() const;
        BatchResult build_result() const;
        void invoke_unexpected_termination() const;

        std::vector<TransferTask> m_tasks;
        MirrorRegistry* p_registry;
        const Context* p_context;
        Options m_options;
        std::size_t m_max_concurrency;
        FailureClassifier m_classifier;
        MirrorSelector m_selector;
        TrackerEnvironment m_environment;
        CURLMultiHandle m_curl_handle;
        std::vector<TaskTracker> m_trackers;
        // Indices in m_trackers, by dispatch order
        std::vector<std::size_t> m_dispatch_order;
        bool m_halted = false;
        bool m_cancelled = false;

        using completion_function = TaskTracker::completion_function;
        std::unordered_map<CURLId, completion_function> m_completion_map;
    };
}

#endif
