// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include <fmt/format.h>

#include "spell/api/clean.hpp"
#include "spell/api/configuration.hpp"
#include "spell/core/context.hpp"
#include "spell/core/error_handling.hpp"
#include "spell/core/output.hpp"
#include "spell/core/recipe.hpp"
#include "spell/core/registry.hpp"

namespace spell
{
    void clean(Configuration& config, bool all, const std::optional<std::string>& name)
    {
        config.load();
        const auto& ctx = config.context();

        auto& console = Console::instance();
        if (!all && !name.has_value())
        {
            console.print("Nothing to do.");
            return;
        }

        auto versions = std::vector<std::string>();
        if (name.has_value())
        {
            const auto recipes = load_all_recipes(ctx.paths.recipes_dir);
            if (auto it = recipes.find(name.value()); it != recipes.end())
            {
                versions.push_back(it->second.version());
            }
            const auto registry = JsonFileRegistry(ctx.paths.db_path);
            if (const auto installed = registry.get(name.value()))
            {
                versions.push_back(installed->version);
            }
            if (versions.empty())
            {
                console.report(
                    message_kind::warning,
                    fmt::format("No recipe or installed version known for {}", name.value())
                );
                return;
            }
        }

        for (const auto& dir : detail::clean_work_dir(ctx.paths.work_dir, all, name, versions))
        {
            console.report(message_kind::success, fmt::format("Cleaned {}", dir.string()));
        }
    }

    namespace detail
    {
        namespace
        {
            void remove_tree(const fs::path& dir)
            {
                std::error_code ec;
                fs::remove_all(dir, ec);
                if (ec)
                {
                    throw spell_error(
                        fmt::format("Could not remove '{}': {}", dir.string(), ec.message()),
                        spell_error_code::internal_failure
                    );
                }
            }
        }

        auto clean_work_dir(
            const fs::path& work_dir,
            bool all,
            const std::optional<std::string>& name,
            const std::vector<std::string>& versions
        ) -> std::vector<fs::path>
        {
            std::vector<fs::path> removed;
            if (!fs::is_directory(work_dir))
            {
                return removed;
            }

            if (all)
            {
                remove_tree(work_dir);
                removed.push_back(work_dir);
                return removed;
            }

            if (name.has_value())
            {
                for (const auto& version : versions)
                {
                    const auto dir = work_dir / fmt::format("{}-{}", name.value(), version);
                    if (fs::is_directory(dir)
                        && std::find(removed.begin(), removed.end(), dir) == removed.end())
                    {
                        removed.push_back(dir);
                    }
                }
                std::sort(removed.begin(), removed.end());
                for (const auto& dir : removed)
                {
                    remove_tree(dir);
                }
            }
            return removed;
        }
    }
}
