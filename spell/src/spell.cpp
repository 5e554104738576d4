// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdlib>
#include <iostream>

#include "spell/api/configuration.hpp"
#include "spell/version.hpp"

#include "common_options.hpp"
#include "spell.hpp"

using namespace spell;  // NOLINT(build/namespaces)

void
set_spell_command(CLI::App* com, Configuration& config)
{
    auto print_version = [](int /*count*/)
    {
        std::cout << spell::version() << std::endl;
        std::exit(0);
    };

    com->add_flag_function("--version", print_version, "Print the version and exit");

    CLI::App* build_subcom = com->add_subcommand("build", "Build a package and its dependencies");
    set_build_command(build_subcom, config);

    CLI::App* install_subcom = com->add_subcommand(
        "install",
        "Build and install packages with their missing dependencies"
    );
    set_install_command(install_subcom, config);

    CLI::App* remove_subcom = com->add_subcommand("remove", "Uninstall packages");
    set_remove_command(remove_subcom, config);

    CLI::App* search_subcom = com->add_subcommand("search", "Find recipes by name");
    set_search_command(search_subcom, config);

    CLI::App* list_subcom = com->add_subcommand("list", "List installed packages");
    set_list_command(list_subcom, config);

    CLI::App* info_subcom = com->add_subcommand("info", "Show the recipe and install state of a package");
    set_info_command(info_subcom, config);

    CLI::App* upgrade_subcom = com->add_subcommand(
        "upgrade",
        "Rebuild packages whose recipe version changed"
    );
    set_upgrade_command(upgrade_subcom, config);

    CLI::App* sync_subcom = com->add_subcommand("sync", "Update the recipes repository");
    set_sync_command(sync_subcom, config);

    CLI::App* clean_subcom = com->add_subcommand("clean", "Remove build workspaces");
    set_clean_command(clean_subcom, config);

    CLI::App* orphans_subcom = com->add_subcommand(
        "orphans",
        "List installed packages no other package needs"
    );
    set_orphans_command(orphans_subcom, config);

    com->require_subcommand(/* min */ 0, /* max */ 1);
}
