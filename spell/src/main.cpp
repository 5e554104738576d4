// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <optional>

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include "spell/api/configuration.hpp"
#include "spell/core/context.hpp"
#include "spell/core/error_handling.hpp"
#include "spell/core/output.hpp"
#include "spell/version.hpp"

#include "spell.hpp"


using namespace spell;  // NOLINT(build/namespaces)

int
main(int argc, char** argv)
{
    spell::Context ctx{ {
        /* .enable_logging = */ true,
        /* .enable_signal_handling = */ true,
    } };
    spell::Console console{ ctx };
    spell::Configuration config{ ctx };

    CLI::App app{ "spell, a source-based package manager\nVersion: " + version() + "\n" };
    set_spell_command(&app, config);

    std::optional<std::string> error_to_report;
    std::optional<std::string> log_to_report;
    int exit_code = 0;
    try
    {
        CLI11_PARSE(app, argc, argv);
        if (app.get_subcommands().size() == 0)
        {
            Console::instance().print(app.help());
        }
    }
    catch (const spell_error& e)
    {
        error_to_report = e.what();
        exit_code = 1;
        if (const auto* failure = e.data_as<SubprocessFailure>())
        {
            exit_code = failure->exit_code != 0 ? failure->exit_code : 1;
            if (!failure->log.empty())
            {
                log_to_report = failure->log.string();
            }
        }
        if (e.error_code() == spell_error_code::user_interrupted)
        {
            exit_code = 130;
        }
    }
    catch (const std::exception& e)
    {
        error_to_report = e.what();
        exit_code = 1;
    }

    if (error_to_report)
    {
        LOG_CRITICAL << error_to_report.value();
        if (log_to_report)
        {
            console.report(message_kind::warning, fmt::format("Check the log: {}", log_to_report.value()));
        }
    }

    return exit_code;
}
