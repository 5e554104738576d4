// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_API_UPDATE_HPP
#define SPELL_API_UPDATE_HPP

#include <string>
#include <vector>

#include "spell/core/recipe.hpp"

namespace spell
{
    class BuildCapabilities;
    class Configuration;
    class Context;
    class PackageRegistry;

    /**
     * Rebuild and reinstall packages whose recipe version differs from the installed one.
     *
     * @param all Target every installed package that still has a recipe instead of ``names``.
     */
    void upgrade(Configuration& config, const std::vector<std::string>& names, bool all);

    /**
     * Update the recipes directory with ``git pull --rebase``.
     */
    void sync(Configuration& config);

    namespace detail
    {
        /**
         * Targets of an upgrade, either the given names or every installed package with a
         * recipe, sorted.
         */
        [[nodiscard]] auto upgrade_targets(
            const recipe_map& recipes,
            const PackageRegistry& registry,
            const std::vector<std::string>& names,
            bool all
        ) -> std::vector<std::string>;

        /**
         * Upgrade each target in turn.
         *
         * @return The names of the packages that went through the pipeline.
         */
        auto upgrade_packages(
            const Context& ctx,
            const recipe_map& recipes,
            PackageRegistry& registry,
            BuildCapabilities& capabilities,
            const std::vector<std::string>& targets
        ) -> std::vector<std::string>;
    }
}

#endif
