// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_API_INSTALL_HPP
#define SPELL_API_INSTALL_HPP

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
     * Build the packages and their dependencies, installing them when asked.
     */
    void build(Configuration& config, const std::vector<std::string>& names, bool install);

    /**
     * Build and install the packages, along with the dependencies not already installed at
     * their recipe version.
     */
    void install(Configuration& config, const std::vector<std::string>& names);

    namespace detail
    {
        struct BuildPlan
        {
            /** Packages to run through the pipeline, in order. */
            std::vector<std::string> order;
            /** Dependencies left out because installed at their recipe version. */
            std::vector<std::string> skipped;
        };

        /**
         * @param skip_installed_deps Leave out dependencies (not targets) installed at the
         *        version of their recipe.
         * @throw spell_error with ``recipe_not_found`` code if a target has no recipe.
         */
        [[nodiscard]] auto plan_build(
            const recipe_map& recipes,
            const PackageRegistry& registry,
            const std::vector<std::string>& targets,
            bool skip_installed_deps
        ) -> BuildPlan;

        void run_build_plan(
            const Context& ctx,
            const recipe_map& recipes,
            PackageRegistry& registry,
            BuildCapabilities& capabilities,
            const BuildPlan& plan,
            bool install
        );
    }
}

#endif
