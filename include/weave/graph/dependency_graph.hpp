#pragma once

/// @file dependency_graph.hpp
/// @brief Acyclic dependency graph over event ids

#include <weave/core/error.hpp>
#include <weave/core/id.hpp>

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace weave_graph {

using weave_core::EventId;
using IdSet = std::unordered_set<EventId>;

// =============================================================================
// DependencyGraph
// =============================================================================

/// @brief Mutable DAG: node -> set of ids it depends on
///
/// Inserts that would close a cycle are rejected and leave the graph untouched.
/// Dependencies on ids that were never added are materialized as empty
/// placeholder nodes, so producers may reference events out of order.
///
/// Mutation is single-writer. Const queries may run concurrently with each
/// other; the transitive-closure cache has its own lock.
class DependencyGraph {
public:
    DependencyGraph() = default;
    ~DependencyGraph() = default;

    // Copyable (cones take snapshots), cache included
    DependencyGraph(const DependencyGraph& other);
    DependencyGraph& operator=(const DependencyGraph& other);

    // ==========================================================================
    // Mutation
    // ==========================================================================

    /// @brief Add a node, or extend an existing node's dependencies
    /// @return GraphError::self_dependency or GraphError::cycle on rejection
    weave_core::Result<void> add_node(const EventId& id, const std::vector<EventId>& depends_on = {});

    // ==========================================================================
    // Queries
    // ==========================================================================

    [[nodiscard]] bool contains(const EventId& id) const;
    [[nodiscard]] std::size_t node_count() const { return m_order.size(); }
    [[nodiscard]] std::size_t edge_count() const { return m_edge_count; }
    [[nodiscard]] bool empty() const { return m_order.empty(); }

    /// Structural generation, bumped on every successful add_node
    [[nodiscard]] std::uint64_t generation() const { return m_generation; }

    /// Nodes in insertion order (placeholders included)
    [[nodiscard]] const std::vector<EventId>& nodes() const { return m_order; }

    /// @brief True iff neither node reaches the other
    ///
    /// Unknown ids are concurrent with everything. A node is never concurrent
    /// with itself.
    [[nodiscard]] bool are_concurrent(const EventId& a, const EventId& b) const;

    /// @brief True iff b transitively depends on a
    [[nodiscard]] bool precedes(const EventId& a, const EventId& b) const;

    /// Direct dependencies (empty for unknown ids)
    [[nodiscard]] IdSet get_dependencies(const EventId& id) const;

    /// Direct dependents (nodes listing id as a dependency)
    [[nodiscard]] IdSet get_dependents(const EventId& id) const;

    /// Transitive dependencies, cached per generation (empty for unknown ids)
    [[nodiscard]] IdSet get_all_dependencies(const EventId& id) const;

    /// @brief One valid total order, dependencies first (Kahn's algorithm)
    ///
    /// Among ready nodes the earliest inserted is emitted first.
    [[nodiscard]] weave_core::Result<std::vector<EventId>> topological_sort() const;

    /// @brief Topological order of the subgraph induced by ids
    ///
    /// Edges leaving the subset are ignored; unknown ids are skipped.
    [[nodiscard]] weave_core::Result<std::vector<EventId>> topological_sort_subset(const IdSet& ids) const;

    /// Nodes without dependencies
    [[nodiscard]] std::vector<EventId> get_roots() const;

    /// Nodes nothing depends on
    [[nodiscard]] std::vector<EventId> get_leaves() const;

private:
    struct Node {
        IdSet depends_on;
        IdSet dependents;
        std::size_t order = 0;
    };

    Node& ensure_node(const EventId& id);

    /// DFS along dependency edges from `from` looking for `target`
    [[nodiscard]] bool reaches(const EventId& from, const EventId& target) const;

    /// Closure lookup; m_cache_mutex must be held
    const IdSet& closure_locked(const EventId& id) const;

    weave_core::Result<std::vector<EventId>> kahn(const IdSet* subset) const;

    std::unordered_map<EventId, Node> m_nodes;
    std::vector<EventId> m_order;
    std::size_t m_edge_count = 0;
    std::uint64_t m_generation = 0;

    mutable std::mutex m_cache_mutex;
    mutable std::uint64_t m_cache_generation = 0;
    mutable std::unordered_map<EventId, IdSet> m_closure_cache;
};

} // namespace weave_graph
