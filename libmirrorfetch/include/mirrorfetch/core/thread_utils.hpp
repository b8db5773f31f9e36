// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef MIRRORFETCH_CORE_THREAD_UTILS_HPP
#define MIRRORFETCH_CORE_THREAD_UTILS_HPP

namespace mirrorfetch
{
    /***********************
     * thread interruption *
     ***********************/

    // SIGINT and SIGTERM only raise the process-wide interrupted flag. Running
    // batches poll that flag and pause their in-flight transfers.
    void set_default_signal_handler();
    void restore_previous_signal_handler();

    void reset_sig_interrupted() noexcept;
    bool is_sig_interrupted() noexcept;
    void set_sig_interrupted() noexcept;

    /**
     * Installs the default signal handler for its lifetime and clears the
     * interrupted flag it may have raised when destroyed.
     */
    class interruption_guard
    {
    public:

        interruption_guard();
        ~interruption_guard();

        interruption_guard(const interruption_guard&) = delete;
        interruption_guard& operator=(const interruption_guard&) = delete;
        interruption_guard(interruption_guard&&) = delete;
        interruption_guard& operator=(interruption_guard&&) = delete;
    };
}

#endif
