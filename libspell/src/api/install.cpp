// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <set>

#include <fmt/format.h>

#include "spell/api/configuration.hpp"
#include "spell/api/install.hpp"
#include "spell/core/capabilities.hpp"
#include "spell/core/context.hpp"
#include "spell/core/error_handling.hpp"
#include "spell/core/output.hpp"
#include "spell/core/pipeline.hpp"
#include "spell/core/registry.hpp"
#include "spell/core/resolver.hpp"
#include "spell/util/string.hpp"

namespace spell
{
    namespace
    {
        void build_impl(
            Configuration& config,
            const std::vector<std::string>& names,
            bool install,
            bool skip_installed_deps
        )
        {
            config.load();
            const auto& ctx = config.context();
            ensure_dirs(ctx);

            const auto recipes = load_all_recipes(ctx.paths.recipes_dir);
            auto registry = JsonFileRegistry(ctx.paths.db_path);
            auto capabilities = SystemCapabilities(ctx);

            const auto plan = detail::plan_build(recipes, registry, names, skip_installed_deps);
            detail::run_build_plan(ctx, recipes, registry, capabilities, plan, install);
        }
    }

    void build(Configuration& config, const std::vector<std::string>& names, bool install)
    {
        build_impl(config, names, install, false);
    }

    void install(Configuration& config, const std::vector<std::string>& names)
    {
        build_impl(config, names, true, true);
    }

    namespace detail
    {
        auto plan_build(
            const recipe_map& recipes,
            const PackageRegistry& registry,
            const std::vector<std::string>& targets,
            bool skip_installed_deps
        ) -> BuildPlan
        {
            if (targets.empty())
            {
                throw spell_error("No package given", spell_error_code::incorrect_usage);
            }
            for (const auto& name : targets)
            {
                if (recipes.count(name) == 0)
                {
                    throw spell_error(
                        fmt::format("No recipe found for '{}'", name),
                        spell_error_code::recipe_not_found
                    );
                }
            }

            const auto target_set = std::set<std::string>(targets.cbegin(), targets.cend());
            auto out = BuildPlan{};
            for (auto& name : resolve(target_set, recipes))
            {
                const auto& recipe = recipes.at(name);
                for (const auto& dep : recipe.all_deps())
                {
                    if (recipes.count(dep) == 0 && !registry.contains(dep))
                    {
                        LOG_WARNING << fmt::format(
                            "Dependency '{}' of '{}' has no recipe and is not installed",
                            dep,
                            name
                        );
                    }
                }

                if (skip_installed_deps && target_set.count(name) == 0)
                {
                    if (auto record = registry.get(name); record && record->version == recipe.version())
                    {
                        out.skipped.push_back(std::move(name));
                        continue;
                    }
                }
                out.order.push_back(std::move(name));
            }
            return out;
        }

        void run_build_plan(
            const Context& ctx,
            const recipe_map& recipes,
            PackageRegistry& registry,
            BuildCapabilities& capabilities,
            const BuildPlan& plan,
            bool install
        )
        {
            auto& console = Console::instance();
            for (const auto& name : plan.skipped)
            {
                LOG_INFO << fmt::format("{} is already installed at {}", name, recipes.at(name).version());
            }
            console.report(
                message_kind::info,
                fmt::format("Build order: {}", util::join(" -> ", plan.order))
            );

            auto pipeline = Pipeline(ctx, registry, capabilities);
            for (const auto& name : plan.order)
            {
                pipeline.execute(recipes.at(name), install);
            }
        }
    }
}
