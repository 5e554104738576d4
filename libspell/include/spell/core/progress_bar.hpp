// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CORE_PROGRESS_BAR_HPP
#define SPELL_CORE_PROGRESS_BAR_HPP

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace spell
{
    class Context;

    /**
     * Cosmetic activity indicator redrawn by a background thread.
     *
     * Nothing is drawn when progress bars are disabled in the context. Stopping waits a bounded
     * time for the drawing thread, after which it is detached and left to exit by itself.
     */
    class Spinner
    {
    public:

        using duration_t = std::chrono::milliseconds;

        static constexpr duration_t frame_period = std::chrono::milliseconds(100);
        static constexpr duration_t stop_timeout = std::chrono::milliseconds(200);

        Spinner(const Context& context, std::string text);
        ~Spinner();

        Spinner(const Spinner&) = delete;
        Spinner& operator=(const Spinner&) = delete;
        Spinner(Spinner&&) = delete;
        Spinner& operator=(Spinner&&) = delete;

        void start();
        void stop();

        bool started() const;
        bool enabled() const;

        struct State;

    private:

        std::shared_ptr<State> p_state;
        std::thread m_thread;
        std::future<void> m_done;
        bool m_enabled;
    };
}

#endif
