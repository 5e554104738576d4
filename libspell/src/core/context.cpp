// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cassert>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include "spell/core/context.hpp"
#include "spell/core/thread_utils.hpp"

namespace spell
{
    namespace
    {
        auto make_logger(const std::string& name, const std::string& pattern)
            -> std::shared_ptr<spdlog::logger>
        {
            auto logger = std::make_shared<spdlog::logger>(
                name,
                std::make_shared<spdlog::sinks::stderr_color_sink_mt>()
            );
            logger->set_formatter(
                std::make_unique<spdlog::pattern_formatter>(pattern, spdlog::pattern_time_type::local)
            );
            return logger;
        }

        spdlog::level::level_enum convert_log_level(log_level l)
        {
            return static_cast<spdlog::level::level_enum>(l);
        }
    }

    // Associate the registration of a logger to the lifetime of this object.
    class Context::ScopedLogger
    {
        std::shared_ptr<spdlog::logger> m_logger;

    public:

        explicit ScopedLogger(std::shared_ptr<spdlog::logger> new_logger)
            : m_logger(std::move(new_logger))
        {
            assert(m_logger);
            spdlog::set_default_logger(m_logger);
        }

        ~ScopedLogger()
        {
            if (m_logger)
            {
                spdlog::drop(m_logger->name());
            }
        }

        std::shared_ptr<spdlog::logger> logger() const
        {
            return m_logger;
        }

        ScopedLogger(ScopedLogger&&) = default;
        ScopedLogger& operator=(ScopedLogger&&) = default;

        ScopedLogger(const ScopedLogger&) = delete;
        ScopedLogger& operator=(const ScopedLogger&) = delete;
    };

    void Context::PathParams::set_defaults_from_home(const fs::path& base)
    {
        home = base;
        recipes_dir = base / "recipes";
        work_dir = base / "work";
        pkgs_dir = base / "pkgs";
        logs_dir = base / "logs";
        db_path = base / "db.json";
    }

    bool is_stdout_atty()
    {
        return ::isatty(STDOUT_FILENO) != 0;
    }

    Context::Context(const ContextOptions& options)
    {
        set_no_color(false);

        if (options.enable_logging)
        {
            m_loggers.emplace_back(make_logger("spell", output_params.log_pattern));
            spdlog::set_level(convert_log_level(output_params.logging_level));
        }
        if (options.enable_signal_handling)
        {
            set_default_signal_handler();
        }
    }

    Context::~Context() = default;

    void Context::set_verbosity(int lvl)
    {
        output_params.verbosity = lvl;

        switch (lvl)
        {
            case -3:
                output_params.logging_level = log_level::off;
                break;
            case -2:
                output_params.logging_level = log_level::critical;
                break;
            case -1:
                output_params.logging_level = log_level::err;
                break;
            case 0:
                output_params.logging_level = log_level::warn;
                break;
            case 1:
                output_params.logging_level = log_level::info;
                break;
            case 2:
                output_params.logging_level = log_level::debug;
                break;
            default:
                output_params.logging_level = lvl > 0 ? log_level::trace : log_level::off;
                break;
        }
        spdlog::set_level(convert_log_level(output_params.logging_level));
    }

    void Context::set_log_level(log_level level)
    {
        output_params.logging_level = level;
        spdlog::set_level(convert_log_level(level));
    }

    void Context::set_no_color(bool no_color)
    {
        const bool cout_is_atty = is_stdout_atty();
        graphics_params.no_color = no_color || !cout_is_atty;
        graphics_params.no_progress_bars = graphics_params.no_color;
        graphics_params.palette = graphics_params.no_color ? Palette::no_color()
                                                           : Palette::terminal();
    }

    std::shared_ptr<spdlog::logger> Context::main_logger() const
    {
        if (m_loggers.empty())
        {
            return spdlog::default_logger();
        }
        return m_loggers.front().logger();
    }
}
