// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CORE_CONTEXT_HPP
#define SPELL_CORE_CONTEXT_HPP

#include <memory>
#include <string>
#include <vector>

#include "spell/core/palette.hpp"
#include "spell/fs/filesystem.hpp"

namespace spdlog
{
    class logger;
}

namespace spell
{
    enum class log_level
    {
        trace,
        debug,
        info,
        warn,
        err,
        critical,
        off
    };

    struct ContextOptions
    {
        bool enable_logging = false;
        bool enable_signal_handling = false;
    };

    /**
     * All the runtime parameters of one invocation.
     *
     * There is no global instance: the context is created by the caller and passed down to
     * every component that needs it.
     */
    class Context
    {
    public:

        struct PathParams
        {
            /** Base directory holding the other ones by default. */
            fs::path home;
            fs::path recipes_dir;
            fs::path work_dir;
            fs::path pkgs_dir;
            fs::path logs_dir;
            /** Registry document. */
            fs::path db_path;

            /** Point every directory at its default location under ``home``. */
            void set_defaults_from_home(const fs::path& home);
        };

        struct BuildParams
        {
            /** Live filesystem root receiving committed files. */
            fs::path install_root = "/";
            std::string prefix = "/usr";
            std::string pkg_config_path = "/usr/lib/pkgconfig:/usr/share/pkgconfig";
            bool use_fakeroot = true;
            int compression_level = 3;
            std::string shell = "/bin/bash";
        };

        struct OutputParams
        {
            int verbosity{ 0 };
            log_level logging_level{ log_level::warn };

            bool json{ false };
            bool quiet{ false };

            std::string log_pattern{ "%^%-9!l%-8n%$ %v" };
        };

        struct GraphicsParams
        {
            bool no_color{ false };
            bool no_progress_bars{ false };
            Palette palette;
        };

        PathParams paths;
        BuildParams build_params;
        OutputParams output_params;
        GraphicsParams graphics_params;

        Context(const ContextOptions& options = {});
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;

        void set_verbosity(int lvl);
        void set_log_level(log_level level);

        /** Switch colors off, or back on when the output is a terminal. */
        void set_no_color(bool no_color);

        std::shared_ptr<spdlog::logger> main_logger() const;

    private:

        class ScopedLogger;
        std::vector<ScopedLogger> m_loggers;
    };

    /** Whether standard output is attached to a terminal. */
    bool is_stdout_atty();
}

#endif
