// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "common_options.hpp"


using namespace spell;  // NOLINT(build/namespaces)

namespace
{
    struct GeneralOptions
    {
        int verbose = 0;
        bool quiet = false;
        bool json = false;
        bool no_color = false;
    };

    GeneralOptions general_options;
}

void
init_general_options(CLI::App* subcom, Configuration& config)
{
    std::string cli_group = "Global options";

    subcom
        ->add_flag(
            "-v,--verbose",
            general_options.verbose,
            "Set verbosity (higher verbosity with multiple -v, e.g. -vvv)"
        )
        ->multi_option_policy(CLI::MultiOptionPolicy::Sum)
        ->group(cli_group);

    subcom->add_flag("-q,--quiet", general_options.quiet, config.at("quiet").description())
        ->group(cli_group);

    subcom->add_flag("--json", general_options.json, config.at("json").description())->group(cli_group);

    subcom->add_flag("--no-color", general_options.no_color, config.at("no_color").description())
        ->group(cli_group);

    init_path_options(subcom, config);
}

void
init_path_options(CLI::App* subcom, Configuration& config)
{
    std::string cli_group = "Path options";

    auto& root = config.at("install_root");
    subcom->add_option("-r,--root-dir", root.get_cli_config(), root.description())
        ->option_text("PATH")
        ->group(cli_group);

    auto& recipes = config.at("recipes_dir");
    subcom->add_option("--recipes-dir", recipes.get_cli_config(), recipes.description())
        ->option_text("PATH")
        ->group(cli_group);

    auto& db = config.at("db_path");
    subcom->add_option("--db", db.get_cli_config(), db.description())
        ->option_text("FILE")
        ->group(cli_group);
}

void
load_general_options(Configuration& config)
{
    if (general_options.verbose > 0)
    {
        config.at("verbosity").set_cli_value(std::to_string(general_options.verbose));
    }
    if (general_options.quiet)
    {
        config.at("quiet").set_cli_value("true");
    }
    if (general_options.json)
    {
        config.at("json").set_cli_value("true");
    }
    if (general_options.no_color)
    {
        config.at("no_color").set_cli_value("true");
    }
}
