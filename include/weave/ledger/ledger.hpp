#pragma once

/// @file ledger.hpp
/// @brief Append-only causal event ledger (trace monoid)
///
/// The ledger is the authoritative record of who did what, in which order,
/// and because of what. It stores records in observation order next to a
/// DependencyGraph; two events commute iff the graph orders neither before the
/// other, and every linearization the ledger hands out respects the graph.
///
/// ```cpp
/// weave_ledger::Ledger<std::string> ledger;
/// auto a = ledger.append(Event<std::string>::create("plan", "planner"));
/// auto b = ledger.append(Event<std::string>::create("build", "builder"), {*a});
/// auto knot = ledger.join({"planner", "builder"});
/// ```

#include <weave/core/error.hpp>
#include <weave/core/id.hpp>
#include <weave/core/log.hpp>
#include <weave/graph/dependency_graph.hpp>
#include <weave/ledger/event.hpp>
#include <weave/ledger/record.hpp>
#include <weave/turn/turn.hpp>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace weave_ledger {

using weave_graph::DependencyGraph;
using weave_graph::IdSet;
using weave_turn::YieldTurn;

// =============================================================================
// Ledger
// =============================================================================

/// @brief Ordered record sequence plus its dependency graph
///
/// Single writer. Const queries may run concurrently with each other but not
/// with append/join; weave::Weave enforces that with a shared mutex.
///
/// Records are immutable once appended and held by shared handle, so copying a
/// ledger copies the graph and indices but never the payloads.
template<typename T>
class Ledger {
public:
    using record_type = Record<T>;
    using RecordPtr = std::shared_ptr<const Record<T>>;

    Ledger() = default;

    // ==========================================================================
    // Append
    // ==========================================================================

    /// @brief Record an event after the given dependencies
    ///
    /// Dependencies on ids not yet recorded become placeholders in the graph.
    /// @return LedgerError::duplicate_event if the id was already recorded,
    ///         GraphError if the dependencies would close a cycle. Nothing is
    ///         recorded on failure.
    weave_core::Result<EventId> append(Event<T> event, const std::vector<EventId>& depends_on = {}) {
        return append_record(std::make_shared<const Record<T>>(std::move(event)), depends_on);
    }

    weave_core::Result<EventId> append(Turn<T> turn, const std::vector<EventId>& depends_on = {}) {
        return append_record(std::make_shared<const Record<T>>(std::move(turn)), depends_on);
    }

    weave_core::Result<EventId> append(const YieldTurn<T>& turn, const std::vector<EventId>& depends_on = {}) {
        return append_record(std::make_shared<const Record<T>>(turn.turn()), depends_on);
    }

    /// @brief Synchronization barrier across sources
    ///
    /// Appends a knot event depending on the causal frontier of every listed
    /// source, so every event a source recorded before the join precedes the
    /// knot. Sources without events are skipped. The knot id is derived from
    /// the tip set, so joining the same tips again returns the existing knot.
    weave_core::Result<EventId> join(const std::vector<std::string>& sources) {
        std::vector<EventId> tips;
        std::optional<double> latest_ts;

        for (const auto& source : sources) {
            for (const auto& id : frontier(source)) {
                if (std::find(tips.begin(), tips.end(), id) != tips.end()) {
                    continue;
                }
                tips.push_back(id);
                const double ts = event_of(*find(id)).timestamp();
                latest_ts = latest_ts ? std::max(*latest_ts, ts) : ts;
            }
        }

        EventId knot_id(std::string(k_knot_prefix) + weave_core::fingerprint_ids(tips));
        if (contains(knot_id)) {
            weave_core::ledger_logger()->trace("Join reused knot {}", knot_id.str());
            return weave_core::Ok(std::move(knot_id));
        }

        Event<T> knot(knot_id, T{}, latest_ts ? *latest_ts : weave_core::now_seconds(), k_knot_source);
        auto result = append(std::move(knot), tips);
        if (result) {
            weave_core::ledger_logger()->debug("Joined {} sources into {} ({} tips)",
                                               sources.size(), knot_id.str(), tips.size());
        }
        return result;
    }

    /// @brief Own events of a source that no other own event depends on
    ///
    /// Always contains the source's latest event. In observation order; empty
    /// for sources without events.
    [[nodiscard]] std::vector<EventId> frontier(const std::string& source) const {
        const std::vector<EventId> own = ids_from(source);
        if (own.empty()) {
            return {};
        }

        // closure(x) is a subset of closure(y) whenever y depends on x, so
        // covered events need not contribute their own closures
        IdSet covered;
        for (auto it = own.rbegin(); it != own.rend(); ++it) {
            if (covered.count(*it) > 0) {
                continue;
            }
            auto upstream = m_graph.get_all_dependencies(*it);
            covered.insert(upstream.begin(), upstream.end());
        }

        std::vector<EventId> result;
        for (const auto& id : own) {
            if (id == own.back() || covered.count(id) == 0) {
                result.push_back(id);
            }
        }
        return result;
    }

    // ==========================================================================
    // Lookup
    // ==========================================================================

    [[nodiscard]] std::size_t size() const noexcept { return m_records.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_records.empty(); }

    /// True iff an event with this id has been recorded (placeholders excluded)
    [[nodiscard]] bool contains(const EventId& id) const { return m_index.count(id) > 0; }

    /// Record by id, nullptr if absent. Invalidated by the next append.
    [[nodiscard]] const Record<T>* find(const EventId& id) const {
        auto it = m_index.find(id);
        return it != m_index.end() ? m_records[it->second].get() : nullptr;
    }

    /// Observation index of a recorded event
    [[nodiscard]] std::optional<std::size_t> position(const EventId& id) const {
        auto it = m_index.find(id);
        if (it == m_index.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// All records in observation order
    [[nodiscard]] const std::vector<RecordPtr>& records() const noexcept { return m_records; }

    [[nodiscard]] std::vector<Record<T>> events_from(const std::string& source) const {
        std::vector<Record<T>> result;
        auto it = m_by_source.find(source);
        if (it != m_by_source.end()) {
            result.reserve(it->second.size());
            for (std::size_t pos : it->second) {
                result.push_back(*m_records[pos]);
            }
        }
        return result;
    }

    [[nodiscard]] std::vector<EventId> ids_from(const std::string& source) const {
        std::vector<EventId> result;
        auto it = m_by_source.find(source);
        if (it != m_by_source.end()) {
            result.reserve(it->second.size());
            for (std::size_t pos : it->second) {
                result.push_back(record_id(*m_records[pos]));
            }
        }
        return result;
    }

    /// Most recently observed event of a source, nullptr if none
    [[nodiscard]] const Record<T>* latest(const std::string& source) const {
        auto it = m_by_source.find(source);
        if (it == m_by_source.end() || it->second.empty()) {
            return nullptr;
        }
        return m_records[it->second.back()].get();
    }

    /// Sources in order of first appearance
    [[nodiscard]] const std::vector<std::string>& sources() const noexcept { return m_sources; }

    /// Declared direct dependencies of a recorded event, in declaration order
    [[nodiscard]] std::vector<EventId> dependencies(const EventId& id) const {
        auto it = m_index.find(id);
        return it != m_index.end() ? m_declared[it->second] : std::vector<EventId>{};
    }

    /// @brief First declared dependency that is a recorded event
    ///
    /// Placeholders are passed over. nullopt for roots, unknown ids and events
    /// whose dependencies are all placeholders.
    [[nodiscard]] std::optional<EventId> parent(const EventId& id) const {
        auto it = m_index.find(id);
        if (it == m_index.end()) {
            return std::nullopt;
        }
        for (const auto& dep : m_declared[it->second]) {
            if (contains(dep)) {
                return dep;
            }
        }
        return std::nullopt;
    }

    /// Direct dependencies of every recorded event
    [[nodiscard]] std::unordered_map<EventId, std::vector<EventId>> dependency_map() const {
        std::unordered_map<EventId, std::vector<EventId>> result;
        result.reserve(m_records.size());
        for (std::size_t i = 0; i < m_records.size(); ++i) {
            result.emplace(record_id(*m_records[i]), m_declared[i]);
        }
        return result;
    }

    [[nodiscard]] const DependencyGraph& graph() const noexcept { return m_graph; }

    // ==========================================================================
    // Ordering
    // ==========================================================================

    [[nodiscard]] bool are_concurrent(const EventId& a, const EventId& b) const {
        return m_graph.are_concurrent(a, b);
    }

    /// @brief Every recorded event in one valid causal order
    ///
    /// Placeholder ids are omitted. Among unordered events, earlier
    /// observations come first.
    [[nodiscard]] weave_core::Result<std::vector<Record<T>>> linearize() const {
        return to_records(m_graph.topological_sort());
    }

    /// Causal order of the subgraph induced by ids; unknown ids are skipped
    [[nodiscard]] weave_core::Result<std::vector<Record<T>>> linearize_subset(const IdSet& ids) const {
        return to_records(m_graph.topological_sort_subset(ids));
    }

    /// @brief A source's events plus everything they transitively depend on
    [[nodiscard]] weave_core::Result<std::vector<Record<T>>> project(const std::string& source) const {
        IdSet cone;
        for (const auto& id : ids_from(source)) {
            cone.insert(id);
            auto upstream = m_graph.get_all_dependencies(id);
            cone.insert(upstream.begin(), upstream.end());
        }
        if (cone.empty()) {
            return weave_core::Ok(std::vector<Record<T>>{});
        }
        return linearize_subset(cone);
    }

private:
    weave_core::Result<EventId> append_record(RecordPtr record, const std::vector<EventId>& depends_on) {
        const Event<T>& event = event_of(*record);
        EventId id = event.id();

        if (contains(id)) {
            weave_core::Error error(weave_core::LedgerError::duplicate_event(id.str()));
            weave_core::ledger_logger()->warn("{}", error.message());
            weave_core::debug::record_error(error);
            return weave_core::Err<EventId>(std::move(error));
        }

        auto added = m_graph.add_node(id, depends_on);
        if (!added) {
            weave_core::Error error = added.error();
            error.with_context("source", event.source());
            weave_core::ledger_logger()->warn("Rejected event {}: {}", id.str(), error.message());
            weave_core::debug::record_error(error);
            return weave_core::Err<EventId>(std::move(error));
        }

        std::vector<EventId> declared;
        declared.reserve(depends_on.size());
        for (const auto& dep : depends_on) {
            if (std::find(declared.begin(), declared.end(), dep) == declared.end()) {
                declared.push_back(dep);
            }
        }

        const std::size_t pos = m_records.size();
        auto& positions = m_by_source[event.source()];
        if (positions.empty()) {
            m_sources.push_back(event.source());
        }
        positions.push_back(pos);

        m_index.emplace(id, pos);
        m_declared.push_back(std::move(declared));
        m_records.push_back(std::move(record));

        weave_core::ledger_logger()->trace("Appended {} ({} deps)", id.str(), depends_on.size());
        return weave_core::Ok(std::move(id));
    }

    weave_core::Result<std::vector<Record<T>>> to_records(
        weave_core::Result<std::vector<EventId>> order) const {
        if (!order) {
            return weave_core::Err<std::vector<Record<T>>>(order.error());
        }

        std::vector<Record<T>> result;
        result.reserve(order->size());
        for (const auto& id : *order) {
            auto it = m_index.find(id);
            if (it != m_index.end()) {
                result.push_back(*m_records[it->second]);
            }
        }
        return weave_core::Ok(std::move(result));
    }

    std::vector<RecordPtr> m_records;
    std::vector<std::vector<EventId>> m_declared;
    std::unordered_map<EventId, std::size_t> m_index;
    std::unordered_map<std::string, std::vector<std::size_t>> m_by_source;
    std::vector<std::string> m_sources;
    DependencyGraph m_graph;
};

} // namespace weave_ledger
