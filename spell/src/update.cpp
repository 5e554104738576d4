// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "spell/api/configuration.hpp"
#include "spell/api/update.hpp"

#include "common_options.hpp"
#include "spell.hpp"


using namespace spell;  // NOLINT(build/namespaces)

void
set_upgrade_command(CLI::App* subcom, Configuration& config)
{
    init_general_options(subcom, config);

    static std::vector<std::string> names;
    auto* names_opt = subcom->add_option("names", names, "Packages to upgrade")->option_text("NAME...");

    static bool upgrade_all = false;
    auto* all_opt = subcom->add_flag("-a,--all", upgrade_all, "Upgrade every installed package");
    all_opt->excludes(names_opt);

    subcom->callback(
        [&config]
        {
            load_general_options(config);
            upgrade(config, names, upgrade_all);
        }
    );
}

void
set_sync_command(CLI::App* subcom, Configuration& config)
{
    init_general_options(subcom, config);

    subcom->callback(
        [&config]
        {
            load_general_options(config);
            sync(config);
        }
    );
}
