// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_CORE_RESOLVER_HPP
#define SPELL_CORE_RESOLVER_HPP

#include <set>
#include <string>
#include <vector>

#include "spell/core/recipe.hpp"
#include "spell/util/graph.hpp"

namespace spell
{
    /**
     * Graph of all the recipes, with an edge from each package to its runtime and build
     * dependencies. Dependencies without a recipe are not part of the graph.
     */
    using DependencyGraph = util::DiGraph<std::string>;

    [[nodiscard]] auto build_dependency_graph(const recipe_map& recipes) -> DependencyGraph;

    /**
     * Names of the packages needed to build the targets: the targets themselves and everything
     * reachable from them, in discovery order.
     *
     * Targets without a recipe are ignored.
     */
    [[nodiscard]] auto
    dependency_closure(const std::set<std::string>& targets, const recipe_map& recipes)
        -> std::vector<std::string>;

    /**
     * Order in which to build the targets and their dependencies.
     *
     * Every dependency comes strictly before the packages depending on it, and the result only
     * depends on the input.
     *
     * @throw spell_error with ``dependency_cycle`` code, and the sorted list of the packages
     *        that could not be ordered as payload.
     */
    [[nodiscard]] auto resolve(const std::set<std::string>& targets, const recipe_map& recipes)
        -> std::vector<std::string>;
}

#endif
