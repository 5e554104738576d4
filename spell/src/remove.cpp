// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "spell/api/configuration.hpp"
#include "spell/api/remove.hpp"

#include "common_options.hpp"
#include "spell.hpp"


using namespace spell;  // NOLINT(build/namespaces)

void
set_remove_command(CLI::App* subcom, Configuration& config)
{
    init_general_options(subcom, config);

    static std::vector<std::string> names;
    subcom->add_option("names", names, "Packages to remove")->required()->option_text("NAME...");

    static bool force = false;
    subcom->add_flag(
        "-f,--force",
        force,
        "Remove even if other installed packages depend on it"
    );

    subcom->callback(
        [&config]
        {
            load_general_options(config);
            remove(config, names, force);
        }
    );
}
