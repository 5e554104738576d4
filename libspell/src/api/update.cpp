// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include <fmt/format.h>

#include "spell/api/configuration.hpp"
#include "spell/api/update.hpp"
#include "spell/core/capabilities.hpp"
#include "spell/core/context.hpp"
#include "spell/core/error_handling.hpp"
#include "spell/core/output.hpp"
#include "spell/core/pipeline.hpp"
#include "spell/core/registry.hpp"
#include "spell/core/resolver.hpp"
#include "spell/core/subprocess.hpp"
#include "spell/util/environment.hpp"

namespace spell
{
    void upgrade(Configuration& config, const std::vector<std::string>& names, bool all)
    {
        config.load();
        const auto& ctx = config.context();
        ensure_dirs(ctx);

        if (!all && names.empty())
        {
            throw spell_error(
                "Give the packages to upgrade or --all",
                spell_error_code::incorrect_usage
            );
        }

        const auto recipes = load_all_recipes(ctx.paths.recipes_dir);
        auto registry = JsonFileRegistry(ctx.paths.db_path);
        auto capabilities = SystemCapabilities(ctx);

        const auto targets = detail::upgrade_targets(recipes, registry, names, all);
        detail::upgrade_packages(ctx, recipes, registry, capabilities, targets);
    }

    void sync(Configuration& config)
    {
        config.load();
        const auto& ctx = config.context();

        const auto& recipes_dir = ctx.paths.recipes_dir;
        if (!fs::is_directory(recipes_dir))
        {
            throw spell_error(
                fmt::format("Recipes directory not found: {}", recipes_dir.string()),
                spell_error_code::recipe_not_found
            );
        }

        auto git = util::which("git");
        if (git.empty())
        {
            throw spell_error(
                "Could not find 'git' in PATH",
                spell_error_code::subprocess_failure,
                SubprocessFailure{ "git", 127, {} }
            );
        }

        Console::instance().report(message_kind::info, "Synchronizing recipes (git pull)");
        CommandOptions options;
        options.description = "git pull --rebase";
        run_command(ctx, { git.string(), "-C", recipes_dir.string(), "pull", "--rebase" }, options);
        Console::instance().report(message_kind::success, "Recipes synchronized");
    }

    namespace detail
    {
        auto upgrade_targets(
            const recipe_map& recipes,
            const PackageRegistry& registry,
            const std::vector<std::string>& names,
            bool all
        ) -> std::vector<std::string>
        {
            std::vector<std::string> out;
            if (all)
            {
                for (const auto& [name, record] : registry.all())
                {
                    if (recipes.count(name) > 0)
                    {
                        out.push_back(name);
                    }
                }
                return out;
            }
            out = names;
            std::sort(out.begin(), out.end());
            out.erase(std::unique(out.begin(), out.end()), out.end());
            return out;
        }

        auto upgrade_packages(
            const Context& ctx,
            const recipe_map& recipes,
            PackageRegistry& registry,
            BuildCapabilities& capabilities,
            const std::vector<std::string>& targets
        ) -> std::vector<std::string>
        {
            auto& console = Console::instance();
            auto pipeline = Pipeline(ctx, registry, capabilities);
            std::vector<std::string> built;

            for (const auto& target : targets)
            {
                auto recipe_it = recipes.find(target);
                if (recipe_it == recipes.end())
                {
                    console.report(message_kind::warning, fmt::format("No recipe for {}", target));
                    continue;
                }
                const auto& recipe = recipe_it->second;
                const auto installed = registry.get(target);
                if (installed && installed->version == recipe.version())
                {
                    console.report(
                        message_kind::success,
                        fmt::format("{} is already at version {}", target, recipe.version())
                    );
                    continue;
                }

                console.report(
                    message_kind::info,
                    fmt::format(
                        "Upgrading {}: {} -> {}",
                        target,
                        installed ? installed->version : "n/a",
                        recipe.version()
                    )
                );
                for (const auto& name : resolve({ target }, recipes))
                {
                    // Missing dependencies come first, installed ones are left alone
                    if (name != target && registry.contains(name))
                    {
                        continue;
                    }
                    pipeline.execute(recipes.at(name), true);
                    built.push_back(name);
                }
            }
            return built;
        }
    }
}
