#pragma once

/// @file weave.hpp
/// @brief Thread-safe facade over ledger, causal cone and yield handler
///
/// Weave owns one ledger and one yield handler with JSON payloads. Producers
/// may append from any thread; readers share a lock with each other and block
/// only while a write is in progress. Approval waits never hold the ledger
/// lock.
///
/// ```cpp
/// weave::Weave weave;
/// auto plan = weave.append({{"step", "plan"}}, "planner");
/// auto gate = weave.submit_yield({{"cmd", "deploy"}}, "deployer", "prod deploy",
///                                {"alice", "bob"}, {*plan});
///
/// std::thread ui([&] { (void)weave.approve(gate->id(), "alice"); (void)weave.approve(gate->id(), "bob"); });
/// auto result = weave.request_approval(*gate);
/// ui.join();
/// ```

#include <weave/cone/causal_cone.hpp>
#include <weave/core/error.hpp>
#include <weave/core/id.hpp>
#include <weave/engine/config.hpp>
#include <weave/govern/strategy.hpp>
#include <weave/govern/yield_handler.hpp>
#include <weave/ledger/ledger.hpp>
#include <weave/turn/turn.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace weave {

using Content = nlohmann::json;

using weave_core::EventId;
using weave_govern::ApprovalStatus;
using weave_govern::ApprovalStrategy;
using weave_turn::TurnKind;
using weave_turn::TurnOptions;

using Event = weave_ledger::Event<Content>;
using Record = weave_ledger::Record<Content>;
using Ledger = weave_ledger::Ledger<Content>;
using Turn = weave_turn::Turn<Content>;
using YieldTurn = weave_turn::YieldTurn<Content>;
using CausalCone = weave_cone::CausalCone<Content>;
using YieldHandler = weave_govern::YieldHandler<Content>;
using ApprovalResult = weave_govern::ApprovalResult<Content>;

// =============================================================================
// WeaveStats
// =============================================================================

struct WeaveStats {
    std::size_t total_events = 0;
    std::map<std::string, std::size_t> by_kind;    ///< Turn kind name, "event" or "knot"
    std::map<std::string, std::size_t> by_source;
    std::size_t pending_yields = 0;
    std::map<std::string, double> compression_by_source;  ///< Knot source excluded
    double average_compression = 0.0;
};

// =============================================================================
// Weave
// =============================================================================

class Weave {
public:
    Weave();

    /// Only the governance settings take effect here; call
    /// WeaveConfig::apply_logging() to install the logging section.
    explicit Weave(WeaveConfig config);
    ~Weave();

    Weave(const Weave&) = delete;
    Weave& operator=(const Weave&) = delete;

    [[nodiscard]] const WeaveConfig& config() const noexcept { return m_config; }

    // ==========================================================================
    // Producers
    // ==========================================================================

    /// Append a plain event. The id is generated unless given.
    weave_core::Result<EventId> append(Content content, const std::string& source,
                                       const std::vector<EventId>& depends_on = {},
                                       std::optional<EventId> id = std::nullopt);

    /// @brief Append a non-yield turn
    /// @return InvalidArgument for TurnKind::Yield (use submit_yield)
    weave_core::Result<EventId> record_turn(TurnKind kind, Content content, const std::string& source,
                                            const std::vector<EventId>& depends_on = {},
                                            TurnOptions options = {});

    /// @brief Append a yield turn to the ledger
    ///
    /// The yield is recorded but not yet waited on; pass it to
    /// request_approval.
    weave_core::Result<YieldTurn> submit_yield(Content content, const std::string& source,
                                               std::string reason,
                                               std::set<std::string> required_approvers,
                                               const std::vector<EventId>& depends_on = {},
                                               TurnOptions options = {});

    /// Barrier across sources (see Ledger::join)
    weave_core::Result<EventId> join(const std::vector<std::string>& sources);

    // ==========================================================================
    // Governance
    // ==========================================================================

    /// @brief Block until the yield resolves
    ///
    /// Timeout and strategy default to the configured governance settings.
    [[nodiscard]] weave_core::Result<ApprovalResult> request_approval(
        const YieldTurn& turn,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt,
        std::optional<ApprovalStrategy> strategy = std::nullopt);

    /// @brief Same, for a yield already recorded in the ledger
    /// @return LedgerError::unknown_event or ApprovalError::not_a_yield
    [[nodiscard]] weave_core::Result<ApprovalResult> request_approval(
        const EventId& id,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt,
        std::optional<ApprovalStrategy> strategy = std::nullopt);

    [[nodiscard]] weave_core::Result<bool> approve(const EventId& id, const std::string& approver);
    bool reject(const EventId& id, const std::string& rejector, const std::string& reason = {});

    [[nodiscard]] std::vector<YieldTurn> list_pending() const { return m_handler.list_pending(); }
    [[nodiscard]] bool is_pending(const EventId& id) const { return m_handler.is_pending(id); }

    void on_approved(YieldHandler::ApprovedCallback callback) { m_handler.on_approved(std::move(callback)); }
    void on_rejected(YieldHandler::RejectedCallback callback) { m_handler.on_rejected(std::move(callback)); }
    void on_timeout(YieldHandler::TimeoutCallback callback) { m_handler.on_timeout(std::move(callback)); }

    // ==========================================================================
    // Queries
    // ==========================================================================

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool contains(const EventId& id) const;
    [[nodiscard]] std::optional<Record> find(const EventId& id) const;
    [[nodiscard]] bool are_concurrent(const EventId& a, const EventId& b) const;
    [[nodiscard]] weave_core::Result<std::vector<Record>> linearize() const;

    /// @brief Detached snapshot of the current ledger
    ///
    /// The cone never touches the live ledger on its own; bring it up to date
    /// with refresh_cone().
    [[nodiscard]] CausalCone cone() const;

    /// Update a cone to the current ledger under the read lock
    void refresh_cone(CausalCone& cone) const;

    [[nodiscard]] weave_core::Result<std::vector<Record>> project_context(const std::string& source) const;
    [[nodiscard]] std::size_t cone_size(const std::string& source) const;
    [[nodiscard]] double compression_ratio(const std::string& source) const;

    [[nodiscard]] WeaveStats stats() const;

    /// @brief Linearized events plus the direct-dependency map
    ///
    /// {"events": [{id, source, timestamp, content, parent, kind?...}],
    ///  "dependencies": {id: [dep, ...]}}
    [[nodiscard]] weave_core::Result<nlohmann::json> export_json() const;

private:
    /// Run fn against a cone that is current with the ledger
    template<typename F>
    auto with_cone(F&& fn) const {
        std::shared_lock ledger_lock(m_mutex);
        std::lock_guard cone_lock(m_cone_mutex);
        if (!m_cone) {
            m_cone.emplace(CausalCone::detached(m_ledger));
        } else if (m_cone->generation() != m_ledger.graph().generation()) {
            m_cone->refresh_from(m_ledger);
        }
        return fn(*m_cone);
    }

    WeaveConfig m_config;

    mutable std::shared_mutex m_mutex;
    Ledger m_ledger;

    mutable std::mutex m_cone_mutex;
    mutable std::optional<CausalCone> m_cone;

    YieldHandler m_handler;
};

} // namespace weave
