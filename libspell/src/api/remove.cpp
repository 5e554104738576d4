// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "spell/api/configuration.hpp"
#include "spell/api/remove.hpp"
#include "spell/core/context.hpp"
#include "spell/core/error_handling.hpp"
#include "spell/core/registry.hpp"
#include "spell/core/uninstall.hpp"

namespace spell
{
    void remove(Configuration& config, const std::vector<std::string>& names, bool force)
    {
        config.load();
        const auto& ctx = config.context();

        if (names.empty())
        {
            throw spell_error("No package given", spell_error_code::incorrect_usage);
        }

        auto registry = JsonFileRegistry(ctx.paths.db_path);
        for (const auto& name : names)
        {
            uninstall(registry, name, force, ctx.build_params.install_root);
        }
    }
}
