// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <map>

#include <fmt/format.h>

#include "spell/core/error_handling.hpp"
#include "spell/core/output.hpp"
#include "spell/core/resolver.hpp"
#include "spell/util/string.hpp"

namespace spell
{
    namespace
    {
        using node_id = DependencyGraph::node_id;

        auto node_ids(const DependencyGraph& graph) -> std::map<std::string, node_id>
        {
            auto ids = std::map<std::string, node_id>();
            graph.for_each_node_id([&](node_id id) { ids.emplace(graph.node(id), id); });
            return ids;
        }
    }

    auto build_dependency_graph(const recipe_map& recipes) -> DependencyGraph
    {
        auto graph = DependencyGraph();
        auto ids = std::map<std::string, node_id>();
        for (const auto& [name, recipe] : recipes)
        {
            ids.emplace(name, graph.add_node(name));
        }
        for (const auto& [name, recipe] : recipes)
        {
            for (const auto& dep : recipe.all_deps())
            {
                if (auto it = ids.find(dep); it != ids.end())
                {
                    graph.add_edge(ids.at(name), it->second);
                }
                else
                {
                    LOG_DEBUG << "Dependency '" << dep << "' of '" << name << "' has no recipe";
                }
            }
        }
        return graph;
    }

    auto dependency_closure(const std::set<std::string>& targets, const recipe_map& recipes)
        -> std::vector<std::string>
    {
        const auto graph = build_dependency_graph(recipes);
        const auto ids = node_ids(graph);

        auto seen = std::vector<bool>(graph.number_of_nodes(), false);
        auto needed = std::vector<std::string>();
        for (const auto& target : targets)
        {
            auto it = ids.find(target);
            if (it == ids.end())
            {
                LOG_DEBUG << "Target '" << target << "' has no recipe";
                continue;
            }
            util::dfs_preorder_nodes_for_each_id(
                graph,
                [&](node_id id)
                {
                    if (!seen[id])
                    {
                        seen[id] = true;
                        needed.push_back(graph.node(id));
                    }
                },
                it->second
            );
        }
        return needed;
    }

    auto resolve(const std::set<std::string>& targets, const recipe_map& recipes)
        -> std::vector<std::string>
    {
        const auto needed = dependency_closure(targets, recipes);

        // Edges go from a dependency to the packages needing it
        auto graph = DependencyGraph();
        auto ids = std::map<std::string, node_id>();
        for (const auto& name : needed)
        {
            ids.emplace(name, graph.add_node(name));
        }
        for (const auto& name : needed)
        {
            for (const auto& dep : recipes.at(name).all_deps())
            {
                if (auto it = ids.find(dep); it != ids.end())
                {
                    graph.add_edge(it->second, ids.at(name));
                }
            }
        }

        const auto order = util::topological_sort(graph);
        if (!order.unresolved.empty())
        {
            auto cyclic = std::vector<std::string>();
            for (const auto id : order.unresolved)
            {
                cyclic.push_back(graph.node(id));
            }
            std::sort(cyclic.begin(), cyclic.end());
            auto msg = fmt::format(
                "Dependency cycle detected between: {}",
                util::join(", ", cyclic)
            );
            throw spell_error(std::move(msg), spell_error_code::dependency_cycle, std::move(cyclic));
        }

        auto out = std::vector<std::string>();
        out.reserve(order.sorted.size());
        for (const auto id : order.sorted)
        {
            out.push_back(graph.node(id));
        }
        return out;
    }
}
