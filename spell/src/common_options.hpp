// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CLI_COMMON_OPTIONS_HPP
#define SPELL_CLI_COMMON_OPTIONS_HPP

#include <CLI/CLI.hpp>

#include "spell/api/configuration.hpp"

void
init_general_options(CLI::App* subcom, spell::Configuration& config);

void
init_path_options(CLI::App* subcom, spell::Configuration& config);

/**
 * Hand the parsed general flags over to the configuration, before it is loaded.
 */
void
load_general_options(spell::Configuration& config);

#endif
