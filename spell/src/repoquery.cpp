// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "spell/api/configuration.hpp"
#include "spell/api/repoquery.hpp"

#include "common_options.hpp"
#include "spell.hpp"


using namespace spell;  // NOLINT(build/namespaces)

void
set_search_command(CLI::App* subcom, Configuration& config)
{
    init_general_options(subcom, config);

    static std::string pattern;
    subcom->add_option("pattern", pattern, "Regular expression matched against recipe names")
        ->required()
        ->option_text("REGEX");

    subcom->callback(
        [&config]
        {
            load_general_options(config);
            search(config, pattern);
        }
    );
}
