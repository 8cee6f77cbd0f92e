#pragma once

/// @file event.hpp
/// @brief Immutable causal event record

#include <weave/core/id.hpp>

#include <optional>
#include <string>
#include <utility>

namespace weave_ledger {

using weave_core::EventId;

/// Source tag of synthetic barrier events created by Ledger::join
inline constexpr const char* k_knot_source = "__knot__";

/// Id prefix of barrier events
inline constexpr const char* k_knot_prefix = "knot:";

// =============================================================================
// Event
// =============================================================================

/// @brief One observation in the ledger
///
/// The content is an opaque payload; the core never inspects it. Timestamps are
/// wall-clock seconds, ties are broken by ledger insertion order.
template<typename T>
class Event {
public:
    using content_type = T;

    Event(EventId id, T content, double timestamp, std::string source)
        : m_id(std::move(id))
        , m_content(std::move(content))
        , m_timestamp(timestamp)
        , m_source(std::move(source)) {}

    /// Create an event, generating the id and stamping the current time if absent
    [[nodiscard]] static Event create(T content, std::string source,
                                      std::optional<EventId> id = std::nullopt,
                                      std::optional<double> timestamp = std::nullopt) {
        return Event(id ? std::move(*id) : EventId::generate(),
                     std::move(content),
                     timestamp ? *timestamp : weave_core::now_seconds(),
                     std::move(source));
    }

    [[nodiscard]] const EventId& id() const noexcept { return m_id; }
    [[nodiscard]] const T& content() const noexcept { return m_content; }
    [[nodiscard]] double timestamp() const noexcept { return m_timestamp; }
    [[nodiscard]] const std::string& source() const noexcept { return m_source; }

    /// True for barrier events produced by Ledger::join
    [[nodiscard]] bool is_knot() const noexcept { return m_source == k_knot_source; }

private:
    EventId m_id;
    T m_content;
    double m_timestamp;
    std::string m_source;
};

} // namespace weave_ledger
