#pragma once

/// @file causal_cone.hpp
/// @brief Minimal causal context projection over a ledger snapshot

#include <weave/core/error.hpp>
#include <weave/core/log.hpp>
#include <weave/graph/dependency_graph.hpp>
#include <weave/ledger/ledger.hpp>

#include <string>
#include <vector>

namespace weave_cone {

using weave_core::EventId;
using weave_graph::IdSet;
using weave_ledger::Ledger;
using weave_ledger::Record;

// =============================================================================
// CausalCone
// =============================================================================

/// @brief Past light-cone of a source: what it must have seen before acting
///
/// The cone snapshots the ledger (graph, indices and shared record handles) at
/// construction and answers from that snapshot until it is refreshed. An
/// attached cone pulls from the ledger it was built from on refresh(); that
/// ledger must outlive the cone and must not be written during the refresh. A
/// detached cone only changes through refresh_from().
template<typename T>
class CausalCone {
public:
    explicit CausalCone(const Ledger<T>& ledger)
        : m_source(&ledger)
        , m_snapshot(ledger) {}

    /// Snapshot that keeps no reference to the ledger
    [[nodiscard]] static CausalCone detached(const Ledger<T>& ledger) {
        CausalCone cone(ledger);
        cone.m_source = nullptr;
        return cone;
    }

    [[nodiscard]] bool is_attached() const noexcept { return m_source != nullptr; }

    /// Re-read the source ledger. No-op for a detached cone.
    void refresh() {
        if (!m_source) {
            weave_core::ledger_logger()->trace("Refresh ignored on detached cone");
            return;
        }
        refresh_from(*m_source);
    }

    /// Replace the snapshot with the given ledger's current state
    void refresh_from(const Ledger<T>& ledger) {
        m_snapshot = ledger;
        weave_core::ledger_logger()->trace("Cone refreshed at generation {} ({} events)",
                                           generation(), total_events());
    }

    /// @brief The source's own events plus every transitive dependency
    ///
    /// Linearized in causal order. Empty if the source has no events.
    [[nodiscard]] weave_core::Result<std::vector<Record<T>>> project_context(const std::string& source) const {
        return project_context_from_events(m_snapshot.ids_from(source));
    }

    /// Same projection seeded from an arbitrary id set
    [[nodiscard]] weave_core::Result<std::vector<Record<T>>> project_context_from_events(
        const std::vector<EventId>& ids) const {
        IdSet cone = collect(ids);
        if (cone.empty()) {
            return weave_core::Ok(std::vector<Record<T>>{});
        }
        return m_snapshot.linearize_subset(cone);
    }

    /// One of the two events transitively depends on the other
    [[nodiscard]] bool are_causally_related(const EventId& a, const EventId& b) const {
        return !m_snapshot.are_concurrent(a, b);
    }

    /// Number of recorded events in the source's cone
    [[nodiscard]] std::size_t cone_size(const std::string& source) const {
        std::size_t count = 0;
        for (const auto& id : collect(m_snapshot.ids_from(source))) {
            if (m_snapshot.contains(id)) {
                ++count;
            }
        }
        return count;
    }

    /// @brief Fraction of the ledger the source may ignore
    ///
    /// 1 - cone_size / total_events, in [0, 1]. 0 for an empty snapshot.
    [[nodiscard]] double compression_ratio(const std::string& source) const {
        const std::size_t total = total_events();
        if (total == 0) {
            return 0.0;
        }
        return 1.0 - static_cast<double>(cone_size(source)) / static_cast<double>(total);
    }

    [[nodiscard]] std::size_t total_events() const noexcept { return m_snapshot.size(); }

    /// Graph generation the snapshot was taken at
    [[nodiscard]] std::uint64_t generation() const noexcept { return m_snapshot.graph().generation(); }

    [[nodiscard]] const Ledger<T>& snapshot() const noexcept { return m_snapshot; }

private:
    [[nodiscard]] IdSet collect(const std::vector<EventId>& seeds) const {
        IdSet cone;
        for (const auto& id : seeds) {
            if (!m_snapshot.graph().contains(id)) {
                continue;
            }
            cone.insert(id);
            auto upstream = m_snapshot.graph().get_all_dependencies(id);
            cone.insert(upstream.begin(), upstream.end());
        }
        return cone;
    }

    const Ledger<T>* m_source;
    Ledger<T> m_snapshot;
};

} // namespace weave_cone
