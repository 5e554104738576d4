// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <atomic>
#include <cstdio>
#include <string_view>

#include <fmt/color.h>
#include <fmt/format.h>

#include "spell/core/context.hpp"
#include "spell/core/progress_bar.hpp"

namespace spell
{
    // Shared with the drawing thread which may outlive the Spinner once detached.
    struct Spinner::State
    {
        std::atomic<bool> stop_requested{ false };
        std::string text;
        fmt::text_style style;
        std::promise<void> done;
    };

    namespace
    {
        constexpr std::string_view frames = "|/-\\";

        void run_spinner(std::shared_ptr<Spinner::State> state)
        {
            std::size_t i = 0;
            while (!state->stop_requested.load())
            {
                const auto frame = std::string(1, frames[i % frames.size()]);
                fmt::print("\r{} {}", fmt::format(state->style, "{}", frame), state->text);
                std::fflush(stdout);
                std::this_thread::sleep_for(Spinner::frame_period);
                ++i;
            }
            state->done.set_value();
        }
    }

    Spinner::Spinner(const Context& context, std::string text)
        : p_state(std::make_shared<State>())
        , m_enabled(!context.graphics_params.no_progress_bars && !context.output_params.quiet
                    && !context.output_params.json)
    {
        p_state->text = std::move(text);
        p_state->style = context.graphics_params.palette.user;
    }

    Spinner::~Spinner()
    {
        stop();
    }

    void Spinner::start()
    {
        // A spinner runs at most once
        if (!m_enabled || started() || p_state->stop_requested.load())
        {
            return;
        }
        m_done = p_state->done.get_future();
        m_thread = std::thread(run_spinner, p_state);
    }

    void Spinner::stop()
    {
        p_state->stop_requested.store(true);
        if (!started())
        {
            return;
        }
        if (m_done.wait_for(stop_timeout) == std::future_status::ready)
        {
            m_thread.join();
        }
        else
        {
            m_thread.detach();
        }
        // Clear the spinner line
        fmt::print("\r\x1b[2K");
        std::fflush(stdout);
    }

    bool Spinner::started() const
    {
        return m_thread.joinable();
    }

    bool Spinner::enabled() const
    {
        return m_enabled;
    }
}
