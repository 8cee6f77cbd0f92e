/// @file weave.cpp
/// @brief Weave facade implementation

#include <weave/engine/weave.hpp>
#include <weave/core/log.hpp>

namespace weave {

namespace {

const char* record_kind_name(const Record& record) {
    if (const Turn* turn = weave_ledger::turn_of(record)) {
        return weave_turn::turn_kind_name(turn->kind());
    }
    return weave_ledger::event_of(record).is_knot() ? "knot" : "event";
}

nlohmann::json approvers_json(const std::set<std::string>& approvers) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& who : approvers) {
        arr.push_back(who);
    }
    return arr;
}

} // anonymous namespace

// =============================================================================
// Lifecycle
// =============================================================================

Weave::Weave()
    : Weave(WeaveConfig{}) {}

Weave::Weave(WeaveConfig config)
    : m_config(std::move(config)) {
    weave_core::core_logger()->debug("Weave created (approval strategy {}, timeout {})",
        weave_govern::approval_strategy_name(m_config.governance.default_strategy),
        m_config.governance.default_timeout
            ? std::to_string(m_config.governance.default_timeout->count()) + "ms"
            : std::string("none"));
}

Weave::~Weave() = default;

// =============================================================================
// Producers
// =============================================================================

weave_core::Result<EventId> Weave::append(Content content, const std::string& source,
                                          const std::vector<EventId>& depends_on,
                                          std::optional<EventId> id) {
    auto event = Event::create(std::move(content), source, std::move(id));
    std::unique_lock lock(m_mutex);
    return m_ledger.append(std::move(event), depends_on);
}

weave_core::Result<EventId> Weave::record_turn(TurnKind kind, Content content, const std::string& source,
                                               const std::vector<EventId>& depends_on,
                                               TurnOptions options) {
    if (kind == TurnKind::Yield) {
        return weave_core::Err<EventId>(weave_core::Error(weave_core::ErrorCode::InvalidArgument,
            "Yield turns carry approvers; use submit_yield"));
    }

    auto turn = Turn::create(kind, std::move(content), source, std::move(options));
    std::unique_lock lock(m_mutex);
    return m_ledger.append(std::move(turn), depends_on);
}

weave_core::Result<YieldTurn> Weave::submit_yield(Content content, const std::string& source,
                                                  std::string reason,
                                                  std::set<std::string> required_approvers,
                                                  const std::vector<EventId>& depends_on,
                                                  TurnOptions options) {
    auto turn = YieldTurn::create(std::move(content), source, std::move(reason),
                                  std::move(required_approvers), std::move(options));

    std::unique_lock lock(m_mutex);
    auto appended = m_ledger.append(turn, depends_on);
    if (!appended) {
        return weave_core::Err<YieldTurn>(appended.error());
    }

    weave_core::log_structured(spdlog::level::debug, "governance", "Yield submitted", {
        {"id", turn.id().str()},
        {"source", source},
        {"reason", turn.reason()},
        {"approvers", std::to_string(turn.required_approvers().size())},
    });
    return weave_core::Ok(std::move(turn));
}

weave_core::Result<EventId> Weave::join(const std::vector<std::string>& sources) {
    std::unique_lock lock(m_mutex);
    return m_ledger.join(sources);
}

// =============================================================================
// Governance
// =============================================================================

weave_core::Result<ApprovalResult> Weave::request_approval(
    const YieldTurn& turn,
    std::optional<std::chrono::milliseconds> timeout,
    std::optional<ApprovalStrategy> strategy) {
    return m_handler.request_approval(
        turn,
        timeout ? timeout : m_config.governance.default_timeout,
        strategy.value_or(m_config.governance.default_strategy));
}

weave_core::Result<ApprovalResult> Weave::request_approval(
    const EventId& id,
    std::optional<std::chrono::milliseconds> timeout,
    std::optional<ApprovalStrategy> strategy) {
    std::optional<YieldTurn> turn;
    {
        std::shared_lock lock(m_mutex);
        const Record* record = m_ledger.find(id);
        if (!record) {
            return weave_core::Err<ApprovalResult>(weave_core::LedgerError::unknown_event(id.str()));
        }
        if (const Turn* stored = weave_ledger::turn_of(*record)) {
            turn = YieldTurn::from_turn(*stored);
        }
    }

    if (!turn) {
        return weave_core::Err<ApprovalResult>(weave_core::ApprovalError::not_a_yield(id.str()));
    }
    return request_approval(*turn, timeout, strategy);
}

weave_core::Result<bool> Weave::approve(const EventId& id, const std::string& approver) {
    return m_handler.approve(id, approver);
}

bool Weave::reject(const EventId& id, const std::string& rejector, const std::string& reason) {
    return m_handler.reject(id, rejector, reason);
}

// =============================================================================
// Queries
// =============================================================================

std::size_t Weave::size() const {
    std::shared_lock lock(m_mutex);
    return m_ledger.size();
}

bool Weave::contains(const EventId& id) const {
    std::shared_lock lock(m_mutex);
    return m_ledger.contains(id);
}

std::optional<Record> Weave::find(const EventId& id) const {
    std::shared_lock lock(m_mutex);
    const Record* record = m_ledger.find(id);
    if (!record) {
        return std::nullopt;
    }
    return *record;
}

bool Weave::are_concurrent(const EventId& a, const EventId& b) const {
    std::shared_lock lock(m_mutex);
    return m_ledger.are_concurrent(a, b);
}

weave_core::Result<std::vector<Record>> Weave::linearize() const {
    std::shared_lock lock(m_mutex);
    return m_ledger.linearize();
}

CausalCone Weave::cone() const {
    std::shared_lock lock(m_mutex);
    return CausalCone::detached(m_ledger);
}

void Weave::refresh_cone(CausalCone& cone) const {
    std::shared_lock lock(m_mutex);
    cone.refresh_from(m_ledger);
}

weave_core::Result<std::vector<Record>> Weave::project_context(const std::string& source) const {
    return with_cone([&source](const CausalCone& cone) { return cone.project_context(source); });
}

std::size_t Weave::cone_size(const std::string& source) const {
    return with_cone([&source](const CausalCone& cone) { return cone.cone_size(source); });
}

double Weave::compression_ratio(const std::string& source) const {
    return with_cone([&source](const CausalCone& cone) { return cone.compression_ratio(source); });
}

WeaveStats Weave::stats() const {
    WeaveStats stats;
    stats.pending_yields = m_handler.pending_count();

    with_cone([&stats](const CausalCone& cone) {
        const Ledger& ledger = cone.snapshot();
        stats.total_events = ledger.size();

        for (const auto& record : ledger.records()) {
            ++stats.by_kind[record_kind_name(*record)];
            ++stats.by_source[weave_ledger::event_of(*record).source()];
        }

        double sum = 0.0;
        for (const auto& source : ledger.sources()) {
            if (source == weave_ledger::k_knot_source) {
                continue;
            }
            const double ratio = cone.compression_ratio(source);
            stats.compression_by_source[source] = ratio;
            sum += ratio;
        }
        if (!stats.compression_by_source.empty()) {
            stats.average_compression = sum / static_cast<double>(stats.compression_by_source.size());
        }
    });

    return stats;
}

weave_core::Result<nlohmann::json> Weave::export_json() const {
    WEAVE_LOG_SCOPE("Weave::export_json");
    std::shared_lock lock(m_mutex);

    auto order = m_ledger.linearize();
    if (!order) {
        return weave_core::Err<nlohmann::json>(order.error());
    }

    nlohmann::json events = nlohmann::json::array();
    nlohmann::json dependencies = nlohmann::json::object();

    for (const auto& record : *order) {
        const Event& event = weave_ledger::event_of(record);
        const std::string& id = event.id().str();

        nlohmann::json entry;
        entry["id"] = id;
        entry["source"] = event.source();
        entry["timestamp"] = event.timestamp();
        entry["content"] = event.content();

        auto parent = m_ledger.parent(event.id());
        entry["parent"] = parent ? nlohmann::json(parent->str()) : nlohmann::json(nullptr);

        if (const Turn* turn = weave_ledger::turn_of(record)) {
            entry["kind"] = weave_turn::turn_kind_name(turn->kind());
            entry["confidence"] = turn->confidence();
            entry["entropy_cost"] = turn->entropy_cost();
            entry["state_pre"] = turn->state_fingerprint_pre();
            entry["state_post"] = turn->state_fingerprint_post();

            if (const auto* gate = turn->gate()) {
                entry["reason"] = gate->reason;
                entry["required_approvers"] = approvers_json(gate->required_approvers);
                entry["approved_by"] = approvers_json(gate->approved_by);
            }
        } else if (event.is_knot()) {
            entry["kind"] = "knot";
        }

        nlohmann::json deps = nlohmann::json::array();
        for (const auto& dep : m_ledger.dependencies(event.id())) {
            deps.push_back(dep.str());
        }
        dependencies[id] = std::move(deps);

        events.push_back(std::move(entry));
    }

    nlohmann::json out;
    out["events"] = std::move(events);
    out["dependencies"] = std::move(dependencies);
    return weave_core::Ok(std::move(out));
}

} // namespace weave
