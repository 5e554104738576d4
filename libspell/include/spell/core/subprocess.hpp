// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CORE_SUBPROCESS_HPP
#define SPELL_CORE_SUBPROCESS_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "spell/fs/filesystem.hpp"

namespace spell
{
    class Context;

    using command_args = std::vector<std::string>;

    struct CommandOptions
    {
        /** Directory to run in, the current one if empty. */
        fs::path working_directory;
        /** Variables added to, or overriding, the host environment. */
        std::map<std::string, std::string> env_extra;
        /** File receiving the combined stdout and stderr of the command. */
        std::optional<fs::path> log_path;
        /** Text shown next to the spinner, the command line if empty. */
        std::string description;
    };

    /**
     * Run a command to completion, blocking until it exits.
     *
     * Standard output and error are captured together, to the log file when one is given.
     *
     * @throw spell_error with ``subprocess_failure`` code and a ``SubprocessFailure`` payload if
     *        the command cannot be started or exits with a non zero status.
     */
    void run_command(const Context& context, const command_args& args, const CommandOptions& options);

    /**
     * Run a command line through the configured shell (``<shell> -c <command>``).
     *
     * @param privileged Wrap the command with ``fakeroot`` when enabled and available.
     */
    void run_shell(
        const Context& context,
        const std::string& command,
        const CommandOptions& options,
        bool privileged = false
    );

    /**
     * The command actually run by @ref run_shell.
     */
    [[nodiscard]] auto shell_command_args(const Context& context, const std::string& command, bool privileged)
        -> command_args;
}

#endif
