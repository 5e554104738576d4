// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "spell/api/configuration.hpp"
#include "spell/api/info.hpp"
#include "spell/core/context.hpp"
#include "spell/core/output.hpp"
#include "spell/core/registry.hpp"
#include "spell/util/string.hpp"

namespace spell
{
    void info(Configuration& config, const std::string& name)
    {
        config.load();
        const auto& ctx = config.context();
        const auto recipes = load_all_recipes(ctx.paths.recipes_dir);
        const auto registry = JsonFileRegistry(ctx.paths.db_path);
        detail::print_info(recipes, registry, name, ctx.output_params.json);
    }

    namespace detail
    {
        void print_info(
            const recipe_map& recipes,
            const PackageRegistry& registry,
            const std::string& name,
            bool json
        )
        {
            auto& console = Console::instance();
            const auto recipe_it = recipes.find(name);
            const auto installed = registry.get(name);

            if (json)
            {
                auto j = nlohmann::json::object();
                j["name"] = name;
                if (recipe_it != recipes.end())
                {
                    const auto& r = recipe_it->second;
                    j["recipe"] = { { "version", r.version() },
                                    { "runtime_deps", r.runtime_deps() },
                                    { "build_deps", r.build_deps() },
                                    { "provides", r.provides() },
                                    { "path", r.path().string() } };
                }
                if (installed)
                {
                    j["installed"] = { { "version", installed->version },
                                       { "files", installed->files.size() } };
                }
                console.json_write({ { "info", j } });
                return;
            }

            if (recipe_it != recipes.end())
            {
                const auto& r = recipe_it->second;
                console.print(fmt::format("Recipe:   {}", r.full_name()));
                console.print(fmt::format("Deps:     {}", util::join(" ", r.runtime_deps())));
                console.print(fmt::format("Build:    {}", util::join(" ", r.build_deps())));
                console.print(fmt::format("Provides: {}", util::join(" ", r.provides())));
            }
            else
            {
                console.report(message_kind::warning, fmt::format("No recipe found for {}", name));
            }
            if (installed)
            {
                console.print(fmt::format(
                    "Installed: {} ({} files)",
                    installed->version,
                    installed->files.size()
                ));
            }
        }
    }
}
