// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "spell/api/configuration.hpp"
#include "spell/api/install.hpp"

#include "common_options.hpp"
#include "spell.hpp"


using namespace spell;  // NOLINT(build/namespaces)

void
set_build_command(CLI::App* subcom, Configuration& config)
{
    init_general_options(subcom, config);

    static std::vector<std::string> names;
    subcom->add_option("names", names, "Packages to build")->required()->option_text("NAME...");

    static bool install_after_build = false;
    subcom->add_flag("--install", install_after_build, "Install the packages once built");

    subcom->callback(
        [&config]
        {
            load_general_options(config);
            build(config, names, install_after_build);
        }
    );
}

void
set_install_command(CLI::App* subcom, Configuration& config)
{
    init_general_options(subcom, config);

    static std::vector<std::string> names;
    subcom->add_option("names", names, "Packages to install")->required()->option_text("NAME...");

    subcom->callback(
        [&config]
        {
            load_general_options(config);
            install(config, names);
        }
    );
}
