/// @file dependency_graph.cpp
/// @brief DependencyGraph implementation

#include <weave/graph/dependency_graph.hpp>
#include <weave/core/log.hpp>

#include <functional>
#include <queue>
#include <utility>

namespace weave_graph {

// =============================================================================
// Copy
// =============================================================================

DependencyGraph::DependencyGraph(const DependencyGraph& other)
    : m_nodes(other.m_nodes)
    , m_order(other.m_order)
    , m_edge_count(other.m_edge_count)
    , m_generation(other.m_generation)
{
    std::lock_guard<std::mutex> lock(other.m_cache_mutex);
    if (other.m_cache_generation == other.m_generation) {
        m_cache_generation = other.m_cache_generation;
        m_closure_cache = other.m_closure_cache;
    }
}

DependencyGraph& DependencyGraph::operator=(const DependencyGraph& other) {
    if (this == &other) {
        return *this;
    }

    m_nodes = other.m_nodes;
    m_order = other.m_order;
    m_edge_count = other.m_edge_count;
    m_generation = other.m_generation;

    std::scoped_lock lock(m_cache_mutex, other.m_cache_mutex);
    m_closure_cache.clear();
    m_cache_generation = 0;
    // A stale cache would be dropped on first use
    if (other.m_cache_generation == other.m_generation) {
        m_cache_generation = other.m_cache_generation;
        m_closure_cache = other.m_closure_cache;
    }
    return *this;
}

// =============================================================================
// Mutation
// =============================================================================

DependencyGraph::Node& DependencyGraph::ensure_node(const EventId& id) {
    auto it = m_nodes.find(id);
    if (it != m_nodes.end()) {
        return it->second;
    }

    Node node;
    node.order = m_order.size();
    m_order.push_back(id);
    return m_nodes.emplace(id, std::move(node)).first->second;
}

weave_core::Result<void> DependencyGraph::add_node(const EventId& id, const std::vector<EventId>& depends_on) {
    for (const auto& dep : depends_on) {
        if (dep == id) {
            weave_core::ledger_logger()->debug("Rejected self-dependency on {}", id.str());
            return weave_core::Err(weave_core::GraphError::self_dependency(id.str()));
        }
    }

    // A new node has no dependents yet, so only an existing node can close a cycle
    if (contains(id)) {
        for (const auto& dep : depends_on) {
            if (contains(dep) && reaches(dep, id)) {
                weave_core::ledger_logger()->debug("Rejected cycle {} -> {}", id.str(), dep.str());
                return weave_core::Err(weave_core::GraphError::cycle(id.str(), dep.str()));
            }
        }
    }

    // Materialize everything first; emplacing may rehash and invalidate references
    ensure_node(id);
    for (const auto& dep : depends_on) {
        ensure_node(dep);
    }

    Node& node = m_nodes.at(id);
    for (const auto& dep : depends_on) {
        if (node.depends_on.insert(dep).second) {
            m_nodes.at(dep).dependents.insert(id);
            ++m_edge_count;
        }
    }

    ++m_generation;
    return weave_core::Ok();
}

// =============================================================================
// Queries
// =============================================================================

bool DependencyGraph::contains(const EventId& id) const {
    return m_nodes.find(id) != m_nodes.end();
}

bool DependencyGraph::reaches(const EventId& from, const EventId& target) const {
    std::unordered_set<EventId> visited;
    std::vector<const EventId*> stack{&from};

    while (!stack.empty()) {
        const EventId& current = *stack.back();
        stack.pop_back();

        if (current == target) {
            return true;
        }
        if (!visited.insert(current).second) {
            continue;
        }

        auto it = m_nodes.find(current);
        if (it == m_nodes.end()) {
            continue;
        }
        for (const auto& dep : it->second.depends_on) {
            stack.push_back(&dep);
        }
    }

    return false;
}

const IdSet& DependencyGraph::closure_locked(const EventId& id) const {
    if (m_cache_generation != m_generation) {
        m_closure_cache.clear();
        m_cache_generation = m_generation;
    }

    auto cached = m_closure_cache.find(id);
    if (cached != m_closure_cache.end()) {
        return cached->second;
    }

    // Iterative post-order DFS: a node's closure is the union of its direct
    // dependencies and their closures. Deep chains must not hit the call stack.
    std::vector<std::pair<EventId, bool>> stack;
    stack.emplace_back(id, false);

    while (!stack.empty()) {
        auto& [current, expanded] = stack.back();

        if (m_closure_cache.count(current)) {
            stack.pop_back();
            continue;
        }

        const Node& node = m_nodes.at(current);

        if (!expanded) {
            expanded = true;
            // Copy before pushing: emplace_back may reallocate under `current`
            EventId parent = current;
            for (const auto& dep : m_nodes.at(parent).depends_on) {
                if (!m_closure_cache.count(dep)) {
                    stack.emplace_back(dep, false);
                }
            }
            continue;
        }

        IdSet closure;
        for (const auto& dep : node.depends_on) {
            closure.insert(dep);
            const IdSet& upstream = m_closure_cache.at(dep);
            closure.insert(upstream.begin(), upstream.end());
        }
        EventId done = current;
        stack.pop_back();
        m_closure_cache.emplace(std::move(done), std::move(closure));
    }

    return m_closure_cache.at(id);
}

IdSet DependencyGraph::get_all_dependencies(const EventId& id) const {
    if (!contains(id)) {
        return {};
    }
    std::lock_guard<std::mutex> lock(m_cache_mutex);
    return closure_locked(id);
}

bool DependencyGraph::precedes(const EventId& a, const EventId& b) const {
    if (a == b || !contains(a) || !contains(b)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_cache_mutex);
    return closure_locked(b).count(a) > 0;
}

bool DependencyGraph::are_concurrent(const EventId& a, const EventId& b) const {
    if (!contains(a) || !contains(b)) {
        return true;
    }
    if (a == b) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_cache_mutex);
    if (closure_locked(b).count(a) > 0) {
        return false;
    }
    return closure_locked(a).count(b) == 0;
}

IdSet DependencyGraph::get_dependencies(const EventId& id) const {
    auto it = m_nodes.find(id);
    return it != m_nodes.end() ? it->second.depends_on : IdSet{};
}

IdSet DependencyGraph::get_dependents(const EventId& id) const {
    auto it = m_nodes.find(id);
    return it != m_nodes.end() ? it->second.dependents : IdSet{};
}

std::vector<EventId> DependencyGraph::get_roots() const {
    std::vector<EventId> result;
    for (const auto& id : m_order) {
        if (m_nodes.at(id).depends_on.empty()) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<EventId> DependencyGraph::get_leaves() const {
    std::vector<EventId> result;
    for (const auto& id : m_order) {
        if (m_nodes.at(id).dependents.empty()) {
            result.push_back(id);
        }
    }
    return result;
}

// =============================================================================
// Topological Sort
// =============================================================================

weave_core::Result<std::vector<EventId>> DependencyGraph::kahn(const IdSet* subset) const {
    auto included = [subset](const EventId& id) {
        return subset == nullptr || subset->count(id) > 0;
    };

    // Ready nodes keyed by insertion order, smallest first
    using Entry = std::size_t;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> ready;
    std::unordered_map<EventId, std::size_t> remaining;
    std::size_t total = 0;

    for (const auto& id : m_order) {
        if (!included(id)) {
            continue;
        }
        ++total;

        std::size_t unresolved = 0;
        for (const auto& dep : m_nodes.at(id).depends_on) {
            if (included(dep)) {
                ++unresolved;
            }
        }

        remaining[id] = unresolved;
        if (unresolved == 0) {
            ready.push(m_nodes.at(id).order);
        }
    }

    std::vector<EventId> result;
    result.reserve(total);

    while (!ready.empty()) {
        const EventId& id = m_order[ready.top()];
        ready.pop();
        result.push_back(id);

        for (const auto& dependent : m_nodes.at(id).dependents) {
            auto it = remaining.find(dependent);
            if (it == remaining.end()) {
                continue;
            }
            if (--it->second == 0) {
                ready.push(m_nodes.at(dependent).order);
            }
        }
    }

    if (result.size() != total) {
        return weave_core::Err<std::vector<EventId>>(
            weave_core::GraphError::unsortable(result.size(), total));
    }

    return weave_core::Ok(std::move(result));
}

weave_core::Result<std::vector<EventId>> DependencyGraph::topological_sort() const {
    return kahn(nullptr);
}

weave_core::Result<std::vector<EventId>> DependencyGraph::topological_sort_subset(const IdSet& ids) const {
    return kahn(&ids);
}

} // namespace weave_graph
