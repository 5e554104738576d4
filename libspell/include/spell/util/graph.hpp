// Copyright (c) 2019, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef SPELL_UTIL_GRAPH_HPP
#define SPELL_UTIL_GRAPH_HPP

#include <cassert>
#include <deque>
#include <set>
#include <utility>
#include <vector>

namespace spell::util
{
    // Simplified implementation of a directed graph.
    // Node ids are dense and given in insertion order.
    template <typename Node>
    class DiGraph
    {
    public:

        using node_t = Node;
        using node_id = std::size_t;
        using node_list = std::vector<node_t>;
        using node_id_list = std::set<node_id>;
        using adjacency_list = std::vector<node_id_list>;

        node_id add_node(const node_t& value);
        node_id add_node(node_t&& value);
        bool add_edge(node_id from, node_id to);

        std::size_t number_of_nodes() const noexcept;
        std::size_t in_degree(node_id id) const noexcept;
        const node_t& node(node_id id) const;
        node_t& node(node_id id);
        const node_id_list& successors(node_id id) const;
        bool has_node(node_id id) const;

        template <typename UnaryFunc>
        UnaryFunc for_each_node_id(UnaryFunc func) const;

    private:

        template <class V>
        node_id add_node_impl(V&& value);

        node_list m_nodes;
        adjacency_list m_predecessors;
        adjacency_list m_successors;
    };

    /**
     * Depth first search from a node, calling the visitor hooks.
     *
     * The visitor must provide ``start_node``, ``finish_node``, ``tree_edge`` and
     * ``back_edge``, for instance by inheriting from @ref EmptyVisitor.
     */
    template <typename Graph, typename Visitor>
    void dfs_raw(const Graph& graph, Visitor&& visitor, typename Graph::node_id start);

    template <typename Graph, typename UnaryFunc>
    void
    dfs_preorder_nodes_for_each_id(const Graph& graph, UnaryFunc&& func, typename Graph::node_id start);

    template <typename Graph>
    struct TopologicalOrder
    {
        using node_id = typename Graph::node_id;

        /** Nodes in an order where every node comes after all its predecessors. */
        std::vector<node_id> sorted;
        /** Nodes that could not be sorted because they are on or behind a cycle. */
        std::vector<node_id> unresolved;
    };

    /**
     * Kahn's algorithm.
     *
     * Ready nodes are processed first in first out, initially in increasing id order, so the
     * result only depends on the graph insertion order.
     */
    template <typename Graph>
    auto topological_sort(const Graph& graph) -> TopologicalOrder<Graph>;

    template <typename Graph>
    class EmptyVisitor
    {
    public:

        using graph_t = Graph;
        using node_id = typename graph_t::node_id;

        void start_node(node_id, const graph_t&)
        {
        }

        void finish_node(node_id, const graph_t&)
        {
        }

        void tree_edge(node_id, node_id, const graph_t&)
        {
        }

        void back_edge(node_id, node_id, const graph_t&)
        {
        }
    };

    /*******************************
     *  DiGraph Implementation  *
     *******************************/

    template <typename N>
    auto DiGraph<N>::number_of_nodes() const noexcept -> std::size_t
    {
        return m_nodes.size();
    }

    template <typename N>
    auto DiGraph<N>::in_degree(node_id id) const noexcept -> std::size_t
    {
        return m_predecessors[id].size();
    }

    template <typename N>
    auto DiGraph<N>::node(node_id id) const -> const node_t&
    {
        return m_nodes.at(id);
    }

    template <typename N>
    auto DiGraph<N>::node(node_id id) -> node_t&
    {
        return m_nodes.at(id);
    }

    template <typename N>
    auto DiGraph<N>::successors(node_id id) const -> const node_id_list&
    {
        return m_successors[id];
    }

    template <typename N>
    auto DiGraph<N>::has_node(node_id id) const -> bool
    {
        return id < m_nodes.size();
    }

    template <typename N>
    auto DiGraph<N>::add_node(const node_t& value) -> node_id
    {
        return add_node_impl(value);
    }

    template <typename N>
    auto DiGraph<N>::add_node(node_t&& value) -> node_id
    {
        return add_node_impl(std::move(value));
    }

    template <typename N>
    template <typename V>
    auto DiGraph<N>::add_node_impl(V&& value) -> node_id
    {
        const node_id id = m_nodes.size();
        m_nodes.push_back(std::forward<V>(value));
        m_successors.emplace_back();
        m_predecessors.emplace_back();
        return id;
    }

    template <typename N>
    bool DiGraph<N>::add_edge(node_id from, node_id to)
    {
        assert(has_node(from) && has_node(to));
        if (!m_successors[from].insert(to).second)
        {
            return false;
        }
        m_predecessors[to].insert(from);
        return true;
    }

    template <typename N>
    template <typename UnaryFunc>
    UnaryFunc DiGraph<N>::for_each_node_id(UnaryFunc func) const
    {
        for (node_id id = 0; id < m_nodes.size(); ++id)
        {
            func(id);
        }
        return func;
    }

    /*******************************
     *  Algorithms implementation  *
     *******************************/

    namespace detail
    {
        enum class Visited
        {
            yes,
            ongoing,
            no
        };

        template <typename Graph, typename Visitor>
        void dfs_raw_impl(
            const Graph& graph,
            Visitor& visitor,
            typename Graph::node_id start,
            std::vector<Visited>& status
        )
        {
            status[start] = Visited::ongoing;
            visitor.start_node(start, graph);
            for (auto child : graph.successors(start))
            {
                if (status[child] == Visited::no)
                {
                    visitor.tree_edge(start, child, graph);
                    dfs_raw_impl(graph, visitor, child, status);
                }
                else if (status[child] == Visited::ongoing)
                {
                    visitor.back_edge(start, child, graph);
                }
            }
            status[start] = Visited::yes;
            visitor.finish_node(start, graph);
        }
    }

    template <typename Graph, typename Visitor>
    void dfs_raw(const Graph& graph, Visitor&& visitor, typename Graph::node_id start)
    {
        if (!graph.has_node(start))
        {
            return;
        }
        auto status = std::vector<detail::Visited>(graph.number_of_nodes(), detail::Visited::no);
        detail::dfs_raw_impl(graph, visitor, start, status);
    }

    template <typename Graph, typename UnaryFunc>
    void
    dfs_preorder_nodes_for_each_id(const Graph& graph, UnaryFunc&& func, typename Graph::node_id start)
    {
        using node_id = typename Graph::node_id;

        struct PreorderVisitor : EmptyVisitor<Graph>
        {
            UnaryFunc& m_func;

            explicit PreorderVisitor(UnaryFunc& f)
                : m_func(f)
            {
            }

            void start_node(node_id n, const Graph&)
            {
                m_func(n);
            }
        };

        dfs_raw(graph, PreorderVisitor(func), start);
    }

    template <typename Graph>
    auto topological_sort(const Graph& graph) -> TopologicalOrder<Graph>
    {
        using node_id = typename Graph::node_id;

        auto out = TopologicalOrder<Graph>{};
        auto in_degree = std::vector<std::size_t>(graph.number_of_nodes(), 0);
        auto ready = std::deque<node_id>();

        graph.for_each_node_id(
            [&](node_id n)
            {
                in_degree[n] = graph.in_degree(n);
                if (in_degree[n] == 0)
                {
                    ready.push_back(n);
                }
            }
        );

        while (!ready.empty())
        {
            const node_id n = ready.front();
            ready.pop_front();
            out.sorted.push_back(n);
            for (const node_id m : graph.successors(n))
            {
                if (--in_degree[m] == 0)
                {
                    ready.push_back(m);
                }
            }
        }

        graph.for_each_node_id(
            [&](node_id n)
            {
                if (in_degree[n] > 0)
                {
                    out.unresolved.push_back(n);
                }
            }
        );
        return out;
    }
}
#endif
