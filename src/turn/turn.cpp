/// @file turn.cpp
/// @brief TurnKind predicates and metadata normalization

#include <weave/turn/turn.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace weave_turn {

const char* turn_kind_name(TurnKind kind) {
    switch (kind) {
        case TurnKind::Speech: return "speech";
        case TurnKind::Action: return "action";
        case TurnKind::Thought: return "thought";
        case TurnKind::Yield: return "yield";
        case TurnKind::Silence: return "silence";
    }
    return "unknown";
}

std::optional<TurnKind> parse_turn_kind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "speech") return TurnKind::Speech;
    if (lower == "action") return TurnKind::Action;
    if (lower == "thought") return TurnKind::Thought;
    if (lower == "yield") return TurnKind::Yield;
    if (lower == "silence") return TurnKind::Silence;
    return std::nullopt;
}

// =============================================================================
// Predicates
// =============================================================================

bool is_observable(TurnKind kind) {
    switch (kind) {
        case TurnKind::Speech:
        case TurnKind::Action:
        case TurnKind::Yield:
        case TurnKind::Silence:
            return true;
        case TurnKind::Thought:
            return false;
    }
    return true;
}

bool is_blocking(TurnKind kind) {
    switch (kind) {
        case TurnKind::Yield:
            return true;
        case TurnKind::Speech:
        case TurnKind::Action:
        case TurnKind::Thought:
        case TurnKind::Silence:
            return false;
    }
    return false;
}

bool is_effectful(TurnKind kind) {
    switch (kind) {
        case TurnKind::Action:
            return true;
        case TurnKind::Speech:
        case TurnKind::Thought:
        case TurnKind::Yield:
        case TurnKind::Silence:
            return false;
    }
    return false;
}

bool requires_governance(TurnKind kind) {
    switch (kind) {
        case TurnKind::Action:
        case TurnKind::Yield:
            return true;
        case TurnKind::Speech:
        case TurnKind::Thought:
        case TurnKind::Silence:
            return false;
    }
    return false;
}

// =============================================================================
// Construction helpers
// =============================================================================

TurnPayload payload_for(TurnKind kind) {
    switch (kind) {
        case TurnKind::Speech: return Speech{};
        case TurnKind::Action: return Action{};
        case TurnKind::Thought: return Thought{};
        case TurnKind::Yield: return YieldGate{};
        case TurnKind::Silence: return Silence{};
    }
    return Speech{};
}

double clamp_confidence(double value) {
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::clamp(value, 0.0, 1.0);
}

double clamp_entropy_cost(double value) {
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::max(value, 0.0);
}

} // namespace weave_turn
