#pragma once

/// @file turn.hpp
/// @brief Governed units of agent behaviour
///
/// A Turn is an Event carrying governance metadata. Its kind is a closed set
/// realized as a std::variant payload whose index is the TurnKind, so every
/// predicate below is an exhaustive switch.
///
/// ```cpp
/// auto turn = weave_turn::Turn<std::string>::create(
///     weave_turn::TurnKind::Action, "rm -rf build/", "builder",
///     {.state_pre = "tree@a1", .confidence = 0.8});
///
/// if (turn.requires_governance()) {
///     auto gate = weave_turn::YieldTurn<std::string>::create(
///         "rm -rf build/", "builder", "destructive", {"alice", "bob"});
///     auto approved = gate.approve("alice");   // returns a new value
/// }
/// ```

#include <weave/core/error.hpp>
#include <weave/core/id.hpp>
#include <weave/ledger/event.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <variant>

namespace weave_turn {

using weave_core::EventId;
using weave_ledger::Event;

// =============================================================================
// TurnKind
// =============================================================================

enum class TurnKind : std::uint8_t {
    Speech = 0,
    Action,
    Thought,
    Yield,
    Silence,
};

[[nodiscard]] const char* turn_kind_name(TurnKind kind);

[[nodiscard]] std::optional<TurnKind> parse_turn_kind(const std::string& name);

/// False only for Thought
[[nodiscard]] bool is_observable(TurnKind kind);

/// True only for Yield
[[nodiscard]] bool is_blocking(TurnKind kind);

/// True only for Action
[[nodiscard]] bool is_effectful(TurnKind kind);

/// True for Action and Yield
[[nodiscard]] bool requires_governance(TurnKind kind);

// =============================================================================
// Payloads
// =============================================================================

struct Speech {};
struct Action {};
struct Thought {};
struct Silence {};

/// Approval gate carried by Yield turns. approved_by is always a subset of
/// required_approvers.
struct YieldGate {
    std::string reason;
    std::set<std::string> required_approvers;
    std::set<std::string> approved_by;
};

/// Alternative order matches TurnKind
using TurnPayload = std::variant<Speech, Action, Thought, YieldGate, Silence>;

static_assert(std::is_same_v<
    std::variant_alternative_t<static_cast<std::size_t>(TurnKind::Yield), TurnPayload>, YieldGate>);
static_assert(std::variant_size_v<TurnPayload> == static_cast<std::size_t>(TurnKind::Silence) + 1);

/// Payload for a non-yield kind (Yield gets an empty gate)
[[nodiscard]] TurnPayload payload_for(TurnKind kind);

/// Clamp into [0, 1]; NaN becomes 0
[[nodiscard]] double clamp_confidence(double value);

/// Clamp into [0, inf); NaN becomes 0
[[nodiscard]] double clamp_entropy_cost(double value);

// =============================================================================
// TurnOptions
// =============================================================================

/// Optional construction parameters shared by all turn kinds
struct TurnOptions {
    std::optional<EventId> id;
    std::optional<double> timestamp;
    std::optional<std::string> state_pre;   ///< Snapshot before the turn (fingerprinted)
    std::optional<std::string> state_post;  ///< Snapshot after the turn (fingerprinted)
    double confidence = 1.0;
    double entropy_cost = 0.0;
};

template<typename T>
class YieldTurn;

// =============================================================================
// Turn
// =============================================================================

template<typename T>
class Turn {
public:
    /// @brief Create a turn of the given kind
    ///
    /// Confidence and entropy cost are clamped here and never again. Yield
    /// turns created this way have an empty gate; use YieldTurn::create.
    [[nodiscard]] static Turn create(TurnKind kind, T content, std::string source, TurnOptions options = {}) {
        return Turn(std::move(content), std::move(source), payload_for(kind), std::move(options));
    }

    [[nodiscard]] const Event<T>& event() const noexcept { return m_event; }
    [[nodiscard]] const EventId& id() const noexcept { return m_event.id(); }
    [[nodiscard]] const T& content() const noexcept { return m_event.content(); }
    [[nodiscard]] double timestamp() const noexcept { return m_event.timestamp(); }
    [[nodiscard]] const std::string& source() const noexcept { return m_event.source(); }

    [[nodiscard]] TurnKind kind() const noexcept { return static_cast<TurnKind>(m_payload.index()); }
    [[nodiscard]] const TurnPayload& payload() const noexcept { return m_payload; }

    /// Gate of a Yield turn, nullptr otherwise
    [[nodiscard]] const YieldGate* gate() const noexcept { return std::get_if<YieldGate>(&m_payload); }

    [[nodiscard]] const std::string& state_fingerprint_pre() const noexcept { return m_state_pre; }
    [[nodiscard]] const std::string& state_fingerprint_post() const noexcept { return m_state_post; }
    [[nodiscard]] double confidence() const noexcept { return m_confidence; }
    [[nodiscard]] double entropy_cost() const noexcept { return m_entropy_cost; }

    [[nodiscard]] bool is_observable() const { return weave_turn::is_observable(kind()); }
    [[nodiscard]] bool is_blocking() const { return weave_turn::is_blocking(kind()); }
    [[nodiscard]] bool is_effectful() const { return weave_turn::is_effectful(kind()); }
    [[nodiscard]] bool requires_governance() const { return weave_turn::requires_governance(kind()); }

private:
    friend class YieldTurn<T>;

    Turn(T content, std::string source, TurnPayload payload, TurnOptions options)
        : m_event(Event<T>::create(std::move(content), std::move(source),
                                   std::move(options.id), options.timestamp))
        , m_payload(std::move(payload))
        , m_state_pre(weave_core::fingerprint(options.state_pre))
        , m_state_post(weave_core::fingerprint(options.state_post))
        , m_confidence(clamp_confidence(options.confidence))
        , m_entropy_cost(clamp_entropy_cost(options.entropy_cost)) {}

    Event<T> m_event;
    TurnPayload m_payload;
    std::string m_state_pre;
    std::string m_state_post;
    double m_confidence;
    double m_entropy_cost;
};

// =============================================================================
// YieldTurn
// =============================================================================

/// @brief A Yield turn: a proposed action withheld until approved
///
/// Values are immutable; approve() returns an updated copy.
template<typename T>
class YieldTurn {
public:
    [[nodiscard]] static YieldTurn create(T content, std::string source, std::string reason,
                                          std::set<std::string> required_approvers,
                                          TurnOptions options = {}) {
        YieldGate gate;
        gate.reason = std::move(reason);
        gate.required_approvers = std::move(required_approvers);
        return YieldTurn(Turn<T>(std::move(content), std::move(source),
                                 TurnPayload(std::move(gate)), std::move(options)));
    }

    /// Yield view of a stored turn, nullopt for other kinds
    [[nodiscard]] static std::optional<YieldTurn> from_turn(const Turn<T>& turn) {
        if (turn.kind() != TurnKind::Yield) {
            return std::nullopt;
        }
        return YieldTurn(turn);
    }

    [[nodiscard]] const Turn<T>& turn() const noexcept { return m_turn; }
    [[nodiscard]] const Event<T>& event() const noexcept { return m_turn.event(); }
    [[nodiscard]] const EventId& id() const noexcept { return m_turn.id(); }
    [[nodiscard]] const T& content() const noexcept { return m_turn.content(); }
    [[nodiscard]] const std::string& source() const noexcept { return m_turn.source(); }

    [[nodiscard]] const std::string& reason() const noexcept { return gate().reason; }
    [[nodiscard]] const std::set<std::string>& required_approvers() const noexcept {
        return gate().required_approvers;
    }
    [[nodiscard]] const std::set<std::string>& approved_by() const noexcept { return gate().approved_by; }

    /// @brief Fold in one approval
    /// @return ApprovalError::invalid_approver if approver is not required
    [[nodiscard]] weave_core::Result<YieldTurn> approve(const std::string& approver) const {
        if (gate().required_approvers.count(approver) == 0) {
            return weave_core::Err<YieldTurn>(
                weave_core::ApprovalError::invalid_approver(id().str(), approver));
        }
        YieldTurn next = *this;
        std::get<YieldGate>(next.m_turn.m_payload).approved_by.insert(approver);
        return weave_core::Ok(std::move(next));
    }

    /// Every required approver has approved
    [[nodiscard]] bool is_approved() const {
        const auto& g = gate();
        for (const auto& who : g.required_approvers) {
            if (g.approved_by.count(who) == 0) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] std::set<std::string> pending_approvers() const {
        const auto& g = gate();
        std::set<std::string> pending;
        for (const auto& who : g.required_approvers) {
            if (g.approved_by.count(who) == 0) {
                pending.insert(who);
            }
        }
        return pending;
    }

private:
    explicit YieldTurn(Turn<T> turn) : m_turn(std::move(turn)) {}

    [[nodiscard]] const YieldGate& gate() const { return std::get<YieldGate>(m_turn.m_payload); }

    Turn<T> m_turn;
};

} // namespace weave_turn
