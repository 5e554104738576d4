// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CLI_SPELL_HPP
#define SPELL_CLI_SPELL_HPP

#include <CLI/CLI.hpp>

namespace spell
{
    class Configuration;
}

void
set_build_command(CLI::App* subcom, spell::Configuration& config);

void
set_install_command(CLI::App* subcom, spell::Configuration& config);

void
set_remove_command(CLI::App* subcom, spell::Configuration& config);

void
set_search_command(CLI::App* subcom, spell::Configuration& config);

void
set_list_command(CLI::App* subcom, spell::Configuration& config);

void
set_orphans_command(CLI::App* subcom, spell::Configuration& config);

void
set_info_command(CLI::App* subcom, spell::Configuration& config);

void
set_upgrade_command(CLI::App* subcom, spell::Configuration& config);

void
set_sync_command(CLI::App* subcom, spell::Configuration& config);

void
set_clean_command(CLI::App* subcom, spell::Configuration& config);

void
set_spell_command(CLI::App* com, spell::Configuration& config);

#endif
