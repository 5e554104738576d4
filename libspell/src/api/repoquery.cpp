// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <regex>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "spell/api/configuration.hpp"
#include "spell/api/repoquery.hpp"
#include "spell/core/context.hpp"
#include "spell/core/error_handling.hpp"
#include "spell/core/output.hpp"

namespace spell
{
    void search(Configuration& config, const std::string& pattern)
    {
        config.load();
        const auto& ctx = config.context();
        const auto recipes = load_all_recipes(ctx.paths.recipes_dir);
        const auto found = detail::search_recipes(recipes, pattern);

        auto& console = Console::instance();
        if (ctx.output_params.json)
        {
            console.json_write({ { "pattern", pattern }, { "matches", found } });
            return;
        }
        for (const auto& name : found)
        {
            console.print(name);
        }
    }

    namespace detail
    {
        auto search_recipes(const recipe_map& recipes, const std::string& pattern)
            -> std::vector<std::string>
        {
            std::regex regex;
            try
            {
                regex = std::regex(pattern, std::regex::ECMAScript);
            }
            catch (const std::regex_error& ex)
            {
                throw spell_error(
                    fmt::format("Invalid search pattern '{}': {}", pattern, ex.what()),
                    spell_error_code::incorrect_usage
                );
            }

            std::vector<std::string> out;
            for (const auto& [name, recipe] : recipes)
            {
                if (std::regex_search(name, regex))
                {
                    out.push_back(name);
                }
            }
            return out;
        }
    }
}
