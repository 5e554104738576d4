// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <optional>

#include "spell/api/clean.hpp"
#include "spell/api/configuration.hpp"

#include "common_options.hpp"
#include "spell.hpp"


using namespace spell;  // NOLINT(build/namespaces)

void
set_clean_command(CLI::App* subcom, Configuration& config)
{
    init_general_options(subcom, config);

    static std::optional<std::string> name;
    auto* name_opt = subcom->add_option("name", name, "Package whose workspaces are removed")
                         ->option_text("NAME");

    static bool clean_all = false;
    subcom->add_flag("-a,--all", clean_all, "Remove the whole work directory")->excludes(name_opt);

    subcom->callback(
        [&config]
        {
            load_general_options(config);
            clean(config, clean_all, name);
        }
    );
}
