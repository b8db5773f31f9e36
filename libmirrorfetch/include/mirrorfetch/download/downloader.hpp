// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_DOWNLOAD_DOWNLOADER_HPP
#define MIRRORFETCH_DOWNLOAD_DOWNLOADER_HPP

#include <string>
#include <string_view>
#include <vector>

#include "mirrorfetch/core/context.hpp"
#include "mirrorfetch/download/mirror_registry.hpp"
#include "mirrorfetch/download/parameters.hpp"
#include "mirrorfetch/download/request.hpp"

namespace mirrorfetch::download
{
    /**
     * Observer of a batch. All the hooks are invoked from the thread running
     * ``download``.
     */
    class Monitor
    {
    public:

        virtual ~Monitor() = default;

        Monitor(const Monitor&) = delete;
        Monitor& operator=(const Monitor&) = delete;
        Monitor(Monitor&&) = delete;
        Monitor& operator=(Monitor&&) = delete;

        void on_transfer_started(const TransferTask& task);
        void on_transfer_finished(const TransferTask& task);
        void on_progress(const TransferTask& task, const Progress& progress);
        void on_done();

    protected:

        Monitor() = default;

    private:

        virtual void on_transfer_started_impl(const TransferTask& task) = 0;
        virtual void on_transfer_finished_impl(const TransferTask& task) = 0;
        virtual void on_progress_impl(const TransferTask& task, const Progress& progress) = 0;
        virtual void on_done_impl() = 0;
    };

    /**
     * Downloads a batch of tasks, at most ``max_concurrency`` transfers at a time.
     *
     * Tasks are dispatched by decreasing priority, then in submission order.
     * Every task gets a terminal result: completed, paused (a partial file is
     * on disk and a later call resumes it) or failed. The failure of a task
     * does not stop the others, except for local filesystem errors which halt
     * the batch.
     */
    BatchResult download(
        std::vector<TransferTask> tasks,
        MirrorRegistry& registry,
        const Context& context,
        Options options = {},
        Monitor* monitor = nullptr
    );

    TaskResult download(
        TransferTask task,
        MirrorRegistry& registry,
        const Context& context,
        Options options = {},
        Monitor* monitor = nullptr
    );

    /**
     * Status of each task derived from the filesystem only: completed when the
     * destination has the expected size, paused when a shorter partial file is
     * present, pending otherwise.
     */
    std::vector<TransferTask> inspect_tasks(std::vector<TransferTask> tasks);

    /// The tasks that a download would resume rather than restart.
    std::vector<TransferTask> find_resumable(std::vector<TransferTask> tasks);

    bool check_resource_exists(const std::string& url, const RemoteFetchParams& params);

    /**
     * Checks that the base URL of the mirror answers, and reports the outcome to
     * the registry. Returns false for an unknown mirror.
     */
    bool probe_mirror(MirrorRegistry& registry, std::string_view name, const RemoteFetchParams& params);
}

#endif
