// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <atomic>
#include <csignal>

#include "mirrorfetch/core/logging.hpp"
#include "mirrorfetch/core/thread_utils.hpp"

namespace mirrorfetch
{
    namespace
    {
        // Written from the signal handler, must stay lock free.
        std::atomic<bool> sig_interrupted(false);
        static_assert(std::atomic<bool>::is_always_lock_free);

        using signal_handler_t = void (*)(int);

        struct handled_signal
        {
            int signum;
            const char* name;
            signal_handler_t previous_handler;
            bool installed;
        };

        handled_signal handled_signals[] = {
            { SIGINT, "SIGINT", SIG_DFL, false },
            { SIGTERM, "SIGTERM", SIG_DFL, false },
        };

        extern "C" void on_interrupt(int)
        {
            sig_interrupted.store(true);
        }
    }

    void set_default_signal_handler()
    {
        for (auto& sig : handled_signals)
        {
            if (sig.installed)
            {
                continue;
            }
            const signal_handler_t previous = std::signal(sig.signum, &on_interrupt);
            if (previous == SIG_ERR)
            {
                LOG_WARNING << "Could not install the " << sig.name
                            << " handler, it will not pause transfers";
                continue;
            }
            sig.previous_handler = previous;
            sig.installed = true;
        }
    }

    void restore_previous_signal_handler()
    {
        for (auto& sig : handled_signals)
        {
            if (!sig.installed)
            {
                continue;
            }
            if (std::signal(sig.signum, sig.previous_handler) == SIG_ERR)
            {
                LOG_WARNING << "Could not restore the previous " << sig.name << " handler";
            }
            sig.previous_handler = SIG_DFL;
            sig.installed = false;
        }
    }

    void reset_sig_interrupted() noexcept
    {
        sig_interrupted.store(false);
    }

    bool is_sig_interrupted() noexcept
    {
        return sig_interrupted.load();
    }

    void set_sig_interrupted() noexcept
    {
        sig_interrupted.store(true);
    }

    /**********************
     * interruption_guard *
     **********************/

    interruption_guard::interruption_guard()
    {
        set_default_signal_handler();
    }

    interruption_guard::~interruption_guard()
    {
        restore_previous_signal_handler();
        if (is_sig_interrupted())
        {
            LOG_INFO << "Transfers were paused by an interruption";
            reset_sig_interrupted();
        }
    }
}
