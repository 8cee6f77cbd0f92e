#pragma once

/// @file record.hpp
/// @brief Ledger entry: a plain event or a governed turn

#include <weave/ledger/event.hpp>
#include <weave/turn/turn.hpp>

#include <variant>

namespace weave_ledger {

using weave_turn::Turn;

/// Ledger entries are either plain events or turns; both expose id/source/timestamp
template<typename T>
using Record = std::variant<Event<T>, Turn<T>>;

/// Underlying event of a record
template<typename T>
[[nodiscard]] const Event<T>& event_of(const Record<T>& record) {
    if (const auto* turn = std::get_if<Turn<T>>(&record)) {
        return turn->event();
    }
    return std::get<Event<T>>(record);
}

/// Turn view of a record, nullptr for plain events
template<typename T>
[[nodiscard]] const Turn<T>* turn_of(const Record<T>& record) {
    return std::get_if<Turn<T>>(&record);
}

template<typename T>
[[nodiscard]] const EventId& record_id(const Record<T>& record) {
    return event_of(record).id();
}

} // namespace weave_ledger
