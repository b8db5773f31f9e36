// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <numeric>
#include <optional>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "mirrorfetch/core/logging.hpp"
#include "mirrorfetch/core/thread_utils.hpp"
#include "mirrorfetch/core/util_scope.hpp"
#include "mirrorfetch/download/downloader.hpp"

#include "curl.hpp"
#include "downloader_impl.hpp"

namespace mirrorfetch::download
{
    namespace
    {
        std::string_view outcome_message(const TransferOutcome& outcome)
        {
            if (const auto* error = std::get_if<Error>(&outcome))
            {
                return error->message;
            }
            if (const auto* partial = std::get_if<Partial>(&outcome))
            {
                return partial->message;
            }
            return "";
        }

        ErrorKind outcome_error_kind(const TransferOutcome& outcome)
        {
            if (const auto* error = std::get_if<Error>(&outcome))
            {
                return error_kind(error->cause);
            }
            return ErrorKind::transient;
        }

        template <class F>
        void safe_invoke(F&& func)
        {
            try
            {
                func();
            }
            catch (const std::exception& e)
            {
                LOG_ERROR << "Exception caught in callback: " << e.what();
            }
        }
    }

    /******************************
     * TaskTracker implementation *
     ******************************/

    /*
     * TaskTracker FSM:
     * WAITING:
     *     - prepare_new_attempt, destination complete => FINISHED
     *     - prepare_new_attempt, local error          => FAILED
     *     - prepare_new_attempt, no mirror left       => FAILED
     *     - prepare_new_attempt                       => RUNNING
     * RUNNING:
     *     - on_transfer_finished(Completed)           => FINISHED
     *     - on_transfer_finished, retry decided       => WAITING
     *     - on_transfer_finished, batch stopping      => PAUSED
     *     - on_transfer_finished, attempts exhausted  => FAILED
     *     - on_transfer_finished, fatal               => FAILED
     * WAITING, batch stopping:
     *     - pause                                     => PAUSED
     */

    TaskTracker::TaskTracker(TransferTask& task, const TrackerEnvironment& env)
        : p_task(&task)
        , p_env(&env)
        , m_handle()
        , m_request{ "", task.destination_path, task.expected_size }
    {
        p_task->status = TaskStatus::pending;
        p_task->attempt_count = 0;
        p_task->last_mirror_tried = std::nullopt;
        p_task->bytes_transferred = regular_file_size(task.destination_path).value_or(0);
    }

    auto TaskTracker::prepare_new_attempt(CURLMultiHandle& handle) -> std::optional<completion_map_entry>
    {
        m_next_retry = std::nullopt;

        // Set here rather than in the constructor: the tracker does not move once the
        // batch has started.
        m_request.progress = [this](const Event& event)
        {
            if (const auto* progress = std::get_if<Progress>(&event))
            {
                p_task->bytes_transferred = progress->downloaded_size;
                if (p_env->p_monitor)
                {
                    p_env->p_monitor->on_progress(*p_task, *progress);
                }
            }
        };

        Preparation preparation = prepare_destination(m_request);
        if (const auto* completed = std::get_if<Completed>(&preparation))
        {
            LOG_INFO << "'" << p_task->identifier << "' already complete in " << p_task->destination_path;
            p_task->bytes_transferred = completed->total_size;
            p_task->status = TaskStatus::completed;
            m_state = State::FINISHED;
            return std::nullopt;
        }
        if (const auto* error = std::get_if<Error>(&preparation))
        {
            set_failed(ErrorKind::fatal, error->message);
            p_env->halt_batch();
            return std::nullopt;
        }
        const StartPoint start = std::get<StartPoint>(preparation);
        p_task->bytes_transferred = start.offset;

        if (select_mirror() == nullptr)
        {
            set_failed(
                ErrorKind::exhausted,
                fmt::format(
                    "No eligible mirror left for '{}' after {} attempt(s)",
                    p_task->identifier,
                    p_task->attempt_count
                )
            );
            return std::nullopt;
        }

        m_request.url = m_mirror->build_url(p_task->url_path);
        ++p_task->attempt_count;
        p_task->last_mirror_tried = m_mirror->name;
        p_task->status = TaskStatus::in_flight;
        m_state = State::RUNNING;

        LOG_DEBUG << fmt::format(
            "Attempt {} for '{}' on mirror '{}' from byte {} [{}]",
            p_task->attempt_count,
            p_task->identifier,
            m_mirror->name,
            start.offset,
            m_request.url
        );

        if (p_env->p_monitor)
        {
            p_env->p_monitor->on_transfer_started(*p_task);
        }

        try
        {
            m_attempt = TransferAttempt(
                m_handle,
                m_request,
                start,
                handle,
                *(p_env->p_params),
                p_env->verbose,
                p_env->should_stop,
                [this](TransferOutcome outcome) { return on_transfer_finished(std::move(outcome)); }
            );
        }
        catch (const curl_error& e)
        {
            // The handle was never added to the multi handle.
            m_handle.reset_handle();
            set_failed(ErrorKind::fatal, fmt::format("Could not start the transfer: {}", e.what()));
            p_env->halt_batch();
            if (p_env->p_monitor)
            {
                p_env->p_monitor->on_transfer_finished(*p_task);
            }
            return std::nullopt;
        }
        return std::make_optional<completion_map_entry>(
            m_handle.get_id(),
            m_attempt.create_completion_function()
        );
    }

    bool TaskTracker::can_start_transfer() const
    {
        return m_state == State::WAITING
               && (!m_next_retry.has_value() || m_next_retry.value() <= clock::now());
    }

    bool TaskTracker::is_active() const
    {
        return m_state == State::WAITING || m_state == State::RUNNING;
    }

    auto TaskTracker::next_retry() const -> std::optional<clock::time_point>
    {
        return m_state == State::WAITING ? m_next_retry : std::nullopt;
    }

    void TaskTracker::pause()
    {
        if (m_state == State::WAITING)
        {
            sync_bytes_on_disk();
            set_paused("Batch stopped before the transfer could complete");
        }
    }

    TaskResult TaskTracker::get_result() const
    {
        return { /* .identifier = */ p_task->identifier,
                 /* .destination = */ p_task->destination_path,
                 /* .status = */ p_task->status,
                 /* .bytes_transferred = */ p_task->bytes_transferred,
                 /* .attempt_count = */ p_task->attempt_count,
                 /* .last_mirror_tried = */ p_task->last_mirror_tried,
                 /* .error = */ m_error,
                 /* .resumable = */ p_task->status != TaskStatus::completed
                     && p_task->bytes_transferred > 0 };
    }

    bool TaskTracker::on_transfer_finished(TransferOutcome outcome)
    {
        if (const auto* completed = std::get_if<Completed>(&outcome))
        {
            on_completed(*completed);
        }
        else
        {
            const Classification classification = p_env->p_classifier
                                                      ->classify(outcome, m_same_mirror_retries)
                                                      .value();
            const std::string_view message = outcome_message(outcome);
            LOG_WARNING << fmt::format(
                "Attempt {} for '{}' on mirror '{}' failed ({}): {}",
                p_task->attempt_count,
                p_task->identifier,
                m_mirror->name,
                to_string(classification.decision),
                message
            );
            p_env->p_classifier
                ->apply(classification, *(p_env->p_registry), m_mirror->name, p_task->identifier, message);
            if (classification.discard_partial)
            {
                std::error_code ec;
                fs::remove(p_task->destination_path, ec);
            }
            sync_bytes_on_disk();
            on_unfinished(outcome, classification);
        }

        if (p_env->p_monitor)
        {
            p_env->p_monitor->on_transfer_finished(*p_task);
        }
        return is_active();
    }

    void TaskTracker::on_completed(const Completed& completed)
    {
        p_env->p_registry->report_success(m_mirror->name);
        p_env->p_registry->mark_present(m_mirror->name, p_task->identifier);
        p_task->bytes_transferred = completed.total_size;
        p_task->status = TaskStatus::completed;
        m_error = std::nullopt;
        m_state = State::FINISHED;
        LOG_INFO << fmt::format(
            "'{}' downloaded from mirror '{}' ({} bytes, resumed from {})",
            p_task->identifier,
            m_mirror->name,
            completed.total_size,
            completed.resumed_from
        );
    }

    void TaskTracker::on_unfinished(const TransferOutcome& outcome, const Classification& classification)
    {
        const std::string message(outcome_message(outcome));

        if (classification.decision == Decision::fatal)
        {
            set_failed(outcome_error_kind(outcome), message);
            if (classification.abort_batch)
            {
                p_env->halt_batch();
            }
            return;
        }

        if (p_env->should_stop())
        {
            set_paused(message);
            return;
        }

        const auto max_attempts = static_cast<std::size_t>(std::max(p_env->p_params->max_attempts, 1));
        if (p_task->attempt_count >= max_attempts)
        {
            set_failed(
                outcome_error_kind(outcome),
                fmt::format("Gave up after {} attempts: {}", p_task->attempt_count, message)
            );
            return;
        }

        p_task->status = TaskStatus::pending;
        m_state = State::WAITING;
        switch (classification.decision)
        {
            case Decision::retry_same_mirror:
                ++m_same_mirror_retries;
                m_next_retry = clock::now() + classification.delay;
                break;
            case Decision::pause_for_resume:
                if (m_same_mirror_retries < p_env->p_classifier->max_same_mirror_retries())
                {
                    ++m_same_mirror_retries;
                    m_next_retry = clock::now() + classification.delay;
                }
                else
                {
                    switch_mirror();
                }
                break;
            case Decision::retry_different_mirror:
                switch_mirror();
                break;
            case Decision::fatal:
                break;
        }
    }

    const MirrorSite* TaskTracker::select_mirror()
    {
        if (m_mirror.has_value())
        {
            // Retry on the same mirror, unless it was deactivated in the meantime.
            auto current = p_env->p_registry->get(m_mirror->name);
            if (current.has_value() && current->is_active)
            {
                m_mirror = std::move(current);
                return &m_mirror.value();
            }
            switch_mirror();
        }
        m_mirror = p_env->p_selector->select(p_task->identifier, *(p_env->p_registry), m_tried_mirrors);
        return m_mirror.has_value() ? &m_mirror.value() : nullptr;
    }

    void TaskTracker::switch_mirror()
    {
        if (m_mirror.has_value())
        {
            m_tried_mirrors.insert(m_mirror->name);
        }
        m_mirror = std::nullopt;
        m_same_mirror_retries = 0;
    }

    void TaskTracker::set_failed(ErrorKind kind, std::string reason)
    {
        LOG_ERROR << fmt::format("'{}' failed ({}): {}", p_task->identifier, to_string(kind), reason);
        m_error = TaskError{ kind, std::move(reason) };
        p_task->status = TaskStatus::failed;
        m_state = State::FAILED;
        m_next_retry = std::nullopt;
    }

    void TaskTracker::set_paused(std::string reason)
    {
        LOG_INFO << fmt::format(
            "'{}' paused with {} bytes on disk: {}",
            p_task->identifier,
            p_task->bytes_transferred,
            reason
        );
        p_task->status = TaskStatus::paused;
        m_state = State::PAUSED;
        m_next_retry = std::nullopt;
    }

    void TaskTracker::sync_bytes_on_disk()
    {
        p_task->bytes_transferred = regular_file_size(p_task->destination_path).value_or(0);
    }

    /*****************************
     * DOWNLOADER IMPLEMENTATION *
     *****************************/

    Downloader::Downloader(
        std::vector<TransferTask> tasks,
        MirrorRegistry& registry,
        const Context& context,
        Options options,
        Monitor* monitor
    )
        : m_tasks(std::move(tasks))
        , p_registry(&registry)
        , p_context(&context)
        , m_options(std::move(options))
        , m_max_concurrency(std::max<std::size_t>(
              m_options.max_concurrency.value_or(context.threads_params.download_threads),
              1
          ))
        , m_classifier(context.remote_fetch_params)
        , m_selector(context.mirror_params.selector)
        , m_environment()
        , m_curl_handle(m_max_concurrency)
        , m_trackers()
    {
        m_environment.p_registry = p_registry;
        m_environment.p_selector = &m_selector;
        m_environment.p_classifier = &m_classifier;
        m_environment.p_params = &(p_context->remote_fetch_params);
        m_environment.p_monitor = monitor;
        m_environment.should_stop = [this]() { return should_stop(); };
        m_environment.halt_batch = [this]() { m_halted = true; };
        // Trace level logging includes the libcurl traces.
        m_environment.verbose = m_options.verbose || context.verbosity >= 2
                                || logging::get_log_level() == log_level::trace;

        // Trackers keep pointers to their task, nothing may reallocate from now on.
        m_trackers.reserve(m_tasks.size());
        for (auto& task : m_tasks)
        {
            m_trackers.emplace_back(task, m_environment);
        }

        m_dispatch_order.resize(m_tasks.size());
        std::iota(m_dispatch_order.begin(), m_dispatch_order.end(), std::size_t(0));
        std::stable_sort(
            m_dispatch_order.begin(),
            m_dispatch_order.end(),
            [this](std::size_t lhs, std::size_t rhs)
            { return m_tasks[lhs].priority > m_tasks[rhs].priority; }
        );
    }

    BatchResult Downloader::download()
    {
        LOG_INFO << fmt::format(
            "Downloading {} task(s), at most {} at a time",
            m_tasks.size(),
            m_max_concurrency
        );
        while (!download_done())
        {
            if (should_stop())
            {
                if (!m_cancelled && !m_halted)
                {
                    m_cancelled = true;
                    LOG_WARNING << "Download interrupted, waiting for running transfers to pause";
                    invoke_unexpected_termination();
                }
                if (m_completion_map.empty())
                {
                    break;
                }
            }
            else
            {
                prepare_next_downloads();
            }
            update_downloads();
        }
        pause_remaining();
        persist_registry();
        return build_result();
    }

    void Downloader::prepare_next_downloads()
    {
        for (std::size_t index : m_dispatch_order)
        {
            if (m_completion_map.size() >= m_max_concurrency || should_stop())
            {
                break;
            }
            TaskTracker& tracker = m_trackers[index];
            if (tracker.can_start_transfer())
            {
                if (auto entry = tracker.prepare_new_attempt(m_curl_handle))
                {
                    m_completion_map.insert(std::move(entry).value());
                }
            }
        }
    }

    void Downloader::update_downloads()
    {
        if (m_completion_map.empty())
        {
            wait_next_retry();
            return;
        }

        try
        {
            std::size_t still_running = m_curl_handle.perform();

            while (auto resp = m_curl_handle.pop_finished())
            {
                auto completion_callback = m_completion_map.find(resp->handle_id);
                if (completion_callback == m_completion_map.end())
                {
                    LOG_ERROR << fmt::format(
                        "Finished transfer with no owner, {} transfers still running",
                        still_running
                    );
                    continue;
                }
                completion_callback->second(m_curl_handle, resp->result);
                m_completion_map.erase(completion_callback);
            }

            if (still_running > 0 && !m_completion_map.empty())
            {
                m_curl_handle.wait(m_curl_handle.get_timeout(100u));
            }
        }
        catch (const curl_error& e)
        {
            LOG_ERROR << "Download engine failure, halting the batch: " << e.what();
            abort_running_transfers();
        }
    }

    void Downloader::abort_running_transfers()
    {
        // Running trackers see the batch halted and pause with what they have on disk.
        m_halted = true;
        auto completion_map = std::exchange(m_completion_map, {});
        for (auto& [id, completion_callback] : completion_map)
        {
            completion_callback(m_curl_handle, CURLE_ABORTED_BY_CALLBACK);
        }
    }

    void Downloader::wait_next_retry() const
    {
        // Nothing running: every active tracker waits for a retry delay.
        std::optional<TaskTracker::clock::time_point> next;
        for (const auto& tracker : m_trackers)
        {
            if (auto retry = tracker.next_retry(); retry.has_value())
            {
                next = next.has_value() ? std::min(next.value(), retry.value()) : retry.value();
            }
        }
        if (next.has_value())
        {
            const auto max_wait = TaskTracker::clock::now() + std::chrono::milliseconds(100);
            std::this_thread::sleep_until(std::min(next.value(), max_wait));
        }
    }

    bool Downloader::download_done() const
    {
        return std::none_of(
            m_trackers.begin(),
            m_trackers.end(),
            [](const TaskTracker& tracker) { return tracker.is_active(); }
        );
    }

    bool Downloader::should_stop() const
    {
        return m_halted || m_options.stop_token.stop_requested() || is_sig_interrupted();
    }

    void Downloader::pause_remaining()
    {
        for (auto& tracker : m_trackers)
        {
            tracker.pause();
        }
    }

    void Downloader::persist_registry() const
    {
        if (!m_options.persist_registry)
        {
            return;
        }
        const auto& path = p_context->mirror_params.mirrors_file;
        if (path.empty())
        {
            LOG_WARNING << "No mirrors file configured, the mirror registry is not saved";
            return;
        }
        if (auto res = p_registry->persist(path); !res)
        {
            LOG_ERROR << "Could not save the mirror registry: " << res.error().what();
        }
    }

    BatchResult Downloader::build_result() const
    {
        BatchResult result;
        result.halted = m_halted;
        result.cancelled = m_cancelled && !m_halted;
        result.results.reserve(m_trackers.size());
        std::transform(
            m_trackers.begin(),
            m_trackers.end(),
            std::back_inserter(result.results),
            [](const TaskTracker& tracker) { return tracker.get_result(); }
        );
        return result;
    }

    void Downloader::invoke_unexpected_termination() const
    {
        if (m_options.on_unexpected_termination.has_value())
        {
            safe_invoke(m_options.on_unexpected_termination.value());
        }
    }

    /*****************************
     * Public API implementation *
     *****************************/

    void Monitor::on_transfer_started(const TransferTask& task)
    {
        on_transfer_started_impl(task);
    }

    void Monitor::on_transfer_finished(const TransferTask& task)
    {
        on_transfer_finished_impl(task);
    }

    void Monitor::on_progress(const TransferTask& task, const Progress& progress)
    {
        on_progress_impl(task, progress);
    }

    void Monitor::on_done()
    {
        on_done_impl();
    }

    BatchResult download(
        std::vector<TransferTask> tasks,
        MirrorRegistry& registry,
        const Context& context,
        Options options,
        Monitor* monitor
    )
    {
        std::optional<interruption_guard> interrupts;
        if (options.handle_interrupts)
        {
            interrupts.emplace();
        }
        on_scope_exit notify_done(
            [monitor]()
            {
                if (monitor != nullptr)
                {
                    monitor->on_done();
                }
            }
        );
        Downloader dl(std::move(tasks), registry, context, std::move(options), monitor);
        return dl.download();
    }

    TaskResult download(
        TransferTask task,
        MirrorRegistry& registry,
        const Context& context,
        Options options,
        Monitor* monitor
    )
    {
        std::vector<TransferTask> tasks(1u, std::move(task));
        auto res = download(std::move(tasks), registry, context, std::move(options), monitor);
        return std::move(res.results.front());
    }

    std::vector<TransferTask> inspect_tasks(std::vector<TransferTask> tasks)
    {
        for (auto& task : tasks)
        {
            const auto size = regular_file_size(task.destination_path);
            task.bytes_transferred = size.value_or(0);
            if (!size.has_value())
            {
                task.status = TaskStatus::pending;
            }
            else if (task.expected_size.has_value() && size.value() == task.expected_size.value())
            {
                task.status = TaskStatus::completed;
            }
            else if (size.value() > 0
                     && (!task.expected_size.has_value() || size.value() < task.expected_size.value()))
            {
                task.status = TaskStatus::paused;
            }
            else
            {
                // Empty or larger than expected: a download starts over.
                task.status = TaskStatus::pending;
            }
        }
        return tasks;
    }

    std::vector<TransferTask> find_resumable(std::vector<TransferTask> tasks)
    {
        tasks = inspect_tasks(std::move(tasks));
        tasks.erase(
            std::remove_if(
                tasks.begin(),
                tasks.end(),
                [](const TransferTask& task) { return task.status != TaskStatus::paused; }
            ),
            tasks.end()
        );
        return tasks;
    }

    bool check_resource_exists(const std::string& url, const RemoteFetchParams& params)
    {
        return curl::check_resource_exists(url, params);
    }

    bool probe_mirror(MirrorRegistry& registry, std::string_view name, const RemoteFetchParams& params)
    {
        const auto mirror = registry.get(name);
        if (!mirror.has_value())
        {
            LOG_WARNING << "Cannot probe unknown mirror '" << name << "'";
            return false;
        }

        bool reachable = false;
        try
        {
            reachable = check_resource_exists(mirror->base_url, params);
        }
        catch (const curl_error& e)
        {
            LOG_ERROR << "Could not probe mirror '" << name << "': " << e.what();
        }

        if (reachable)
        {
            registry.report_success(name);
        }
        else
        {
            registry.report_failure(
                name,
                FailureSeverity::moderate,
                fmt::format("Health check failed [{}]", mirror->base_url)
            );
        }
        LOG_DEBUG << "Mirror '" << name << "' " << (reachable ? "is" : "is not") << " reachable";
        return reachable;
    }
}
