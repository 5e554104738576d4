// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "spell/api/configuration.hpp"
#include "spell/api/list.hpp"
#include "spell/core/context.hpp"
#include "spell/core/output.hpp"
#include "spell/core/registry.hpp"
#include "spell/core/uninstall.hpp"

namespace spell
{
    void list(Configuration& config)
    {
        config.load();
        const auto& ctx = config.context();
        const auto registry = JsonFileRegistry(ctx.paths.db_path);
        detail::print_installed(registry, ctx.output_params.json);
    }

    void orphans(Configuration& config)
    {
        config.load();
        const auto& ctx = config.context();
        const auto registry = JsonFileRegistry(ctx.paths.db_path);
        detail::print_orphans(registry, ctx.output_params.json);
    }

    namespace detail
    {
        void print_installed(const PackageRegistry& registry, bool json)
        {
            auto& console = Console::instance();
            const auto installed = registry.all();
            if (json)
            {
                auto pkgs = nlohmann::json::array();
                for (const auto& [name, record] : installed)
                {
                    pkgs.push_back({ { "name", name }, { "version", record.version } });
                }
                console.json_write({ { "installed", pkgs } });
                return;
            }
            for (const auto& [name, record] : installed)
            {
                console.print(fmt::format("{} {}", name, record.version));
            }
        }

        void print_orphans(const PackageRegistry& registry, bool json)
        {
            auto& console = Console::instance();
            const auto found = find_orphans(registry);
            if (json)
            {
                console.json_write({ { "orphans", found } });
                return;
            }
            for (const auto& name : found)
            {
                console.print(name);
            }
        }
    }
}
