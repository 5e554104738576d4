// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CORE_THREAD_UTILS_HPP
#define SPELL_CORE_THREAD_UTILS_HPP

#include <csignal>

namespace spell
{
    /***********************
     * thread interruption *
     ***********************/

    using signal_handler_t = void (*)(int);

    void set_default_signal_handler();
    void restore_previous_signal_handler();
    bool is_sig_interrupted() noexcept;
    void set_sig_interrupted() noexcept;
    void reset_sig_interrupted() noexcept;

    /**
     * Throw a ``user_interrupted`` error if SIGINT was received.
     *
     * Called between pipeline stages; a running subprocess receives the signal itself.
     */
    void interruption_point();
}

#endif
