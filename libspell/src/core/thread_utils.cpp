// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <atomic>

#include "spell/core/error_handling.hpp"
#include "spell/core/thread_utils.hpp"

namespace spell
{
    namespace
    {
        std::atomic<bool> sig_interrupted(false);
        std::atomic<signal_handler_t> previous_handler = SIG_DFL;

        void on_sigint(int /*signum*/)
        {
            sig_interrupted.store(true);
        }
    }

    void set_default_signal_handler()
    {
        previous_handler = std::signal(SIGINT, on_sigint);
    }

    void restore_previous_signal_handler()
    {
        std::signal(SIGINT, previous_handler.exchange(SIG_DFL));
    }

    bool is_sig_interrupted() noexcept
    {
        return sig_interrupted.load();
    }

    void set_sig_interrupted() noexcept
    {
        sig_interrupted.store(true);
    }

    void reset_sig_interrupted() noexcept
    {
        sig_interrupted.store(false);
    }

    void interruption_point()
    {
        if (is_sig_interrupted())
        {
            throw spell_error("Interrupted by user", spell_error_code::user_interrupted);
        }
    }
}
