// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <tuple>

#include <fmt/format.h>
#include <reproc++/run.hpp>
#include <reproc/reproc.h>

#include "spell/core/context.hpp"
#include "spell/core/error_handling.hpp"
#include "spell/core/output.hpp"
#include "spell/core/progress_bar.hpp"
#include "spell/core/subprocess.hpp"
#include "spell/core/thread_utils.hpp"
#include "spell/core/util.hpp"
#include "spell/util/environment.hpp"
#include "spell/util/string.hpp"

namespace spell
{
    namespace
    {
        bool reproc_killed(int status)
        {
            return status == REPROC_SIGKILL;
        }

        bool reproc_terminated(int status)
        {
            return status == REPROC_SIGTERM;
        }

        [[noreturn]] void
        throw_failure(const std::string& cmdline, int exit_code, const std::optional<fs::path>& log)
        {
            auto msg = fmt::format("Command failed with status {}: {}", exit_code, cmdline);
            throw spell_error(
                std::move(msg),
                spell_error_code::subprocess_failure,
                SubprocessFailure{ cmdline, exit_code, log.value_or(fs::path()) }
            );
        }
    }

    void run_command(const Context& context, const command_args& args, const CommandOptions& options)
    {
        const auto cmdline = util::join(" ", args);
        LOG_DEBUG << "Running: " << cmdline
                  << (options.working_directory.empty()
                          ? std::string()
                          : fmt::format(" (in {})", options.working_directory.string()));

        reproc::options reproc_options;
        reproc_options.env.behavior = reproc::env::extend;
        reproc_options.env.extra = options.env_extra;
        const std::string cwd = options.working_directory.string();
        if (!cwd.empty())
        {
            reproc_options.working_directory = cwd.c_str();
        }
        reproc_options.redirect.err.type = reproc::redirect::stdout_;

        std::ofstream log_stream;
        if (options.log_path.has_value())
        {
            fs::create_directories(options.log_path->parent_path());
            log_stream = open_ofstream(options.log_path.value(), std::ios::out | std::ios::trunc);
            if (!log_stream.good())
            {
                throw_failure(cmdline, 1, std::nullopt);
            }
        }

        std::string output;
        int status = 0;
        std::error_code ec;
        {
            auto spinner = Spinner(
                context,
                options.description.empty() ? cmdline : options.description
            );
            spinner.start();
            if (log_stream.is_open())
            {
                std::tie(status, ec) = reproc::run(
                    args,
                    reproc_options,
                    reproc::sink::ostream(log_stream),
                    reproc::sink::null
                );
            }
            else
            {
                std::tie(status, ec) = reproc::run(
                    args,
                    reproc_options,
                    reproc::sink::string(output),
                    reproc::sink::null
                );
            }
        }

        if (!output.empty())
        {
            LOG_TRACE << output;
        }
        interruption_point();

        if (ec)
        {
            LOG_ERROR << "Subprocess call failed: " << ec.message();
            throw_failure(cmdline, 1, options.log_path);
        }
        if (reproc_killed(status) || reproc_terminated(status))
        {
            LOG_ERROR << "Subprocess was " << (reproc_killed(status) ? "killed" : "terminated");
            throw_failure(cmdline, 1, options.log_path);
        }
        if (status != 0)
        {
            throw_failure(cmdline, status, options.log_path);
        }
    }

    auto shell_command_args(const Context& context, const std::string& command, bool privileged)
        -> command_args
    {
        auto args = command_args();
        if (privileged && context.build_params.use_fakeroot)
        {
            if (auto fakeroot = util::which("fakeroot"); !fakeroot.empty())
            {
                args.push_back(fakeroot.string());
            }
            else
            {
                LOG_DEBUG << "fakeroot not found, running install step without it";
            }
        }
        args.push_back(context.build_params.shell);
        args.push_back("-c");
        args.push_back(command);
        return args;
    }

    void run_shell(
        const Context& context,
        const std::string& command,
        const CommandOptions& options,
        bool privileged
    )
    {
        auto opts = options;
        if (opts.description.empty())
        {
            opts.description = command;
        }
        run_command(context, shell_command_args(context, command, privileged), opts);
    }
}
