#pragma once

/// @file id.hpp
/// @brief Event identifiers, fingerprints and clocks for weave_core

#include "fwd.hpp"
#include <atomic>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace weave_core {

// =============================================================================
// FNV-1a Hash
// =============================================================================

namespace detail {

constexpr std::uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr std::uint64_t FNV_PRIME = 0x100000001b3ULL;

[[nodiscard]] constexpr std::uint64_t fnv1a_hash(const char* str, std::size_t len) noexcept {
    std::uint64_t hash = FNV_OFFSET_BASIS;
    for (std::size_t i = 0; i < len; ++i) {
        hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(str[i]));
        hash *= FNV_PRIME;
    }
    return hash;
}

[[nodiscard]] inline std::uint64_t fnv1a_hash(const std::string& str) noexcept {
    return fnv1a_hash(str.data(), str.size());
}

} // namespace detail

// =============================================================================
// EventId
// =============================================================================

/// Opaque event handle. Producers may pick their own ids; generated ids are
/// unique within the process.
struct EventId {
    std::string value;

    EventId() = default;
    explicit EventId(std::string v) : value(std::move(v)) {}
    explicit EventId(const char* v) : value(v) {}

    /// Generate a fresh process-unique id ("evt-<session>-<counter>")
    [[nodiscard]] static EventId generate();

    [[nodiscard]] const std::string& str() const noexcept { return value; }
    [[nodiscard]] bool empty() const noexcept { return value.empty(); }

    auto operator<=>(const EventId&) const = default;
    bool operator==(const EventId&) const = default;
};

/// Thread-safe generator for EventIds
class EventIdGenerator {
public:
    /// @param prefix Leading tag of every generated id
    explicit EventIdGenerator(std::string prefix);

    [[nodiscard]] EventId next();

    /// Number of ids handed out so far
    [[nodiscard]] std::uint64_t current() const noexcept {
        return m_next.load(std::memory_order_relaxed);
    }

private:
    std::string m_prefix;
    std::atomic<std::uint64_t> m_next{0};
};

// =============================================================================
// Fingerprints
// =============================================================================

/// Sentinel fingerprint for an absent snapshot
inline constexpr const char* k_empty_fingerprint = "empty";

/// 16 hex digit FNV-1a fingerprint of a snapshot, or "empty" when absent
[[nodiscard]] std::string fingerprint(const std::optional<std::string>& snapshot);

/// Order-independent fingerprint of an id set (16 hex digits)
[[nodiscard]] std::string fingerprint_ids(std::vector<EventId> ids);

/// Format a 64-bit value as 16 lowercase hex digits
[[nodiscard]] std::string to_hex(std::uint64_t value);

// =============================================================================
// Clock
// =============================================================================

/// Wall-clock seconds since the Unix epoch
[[nodiscard]] double now_seconds();

} // namespace weave_core

template<>
struct std::hash<weave_core::EventId> {
    std::size_t operator()(const weave_core::EventId& id) const noexcept {
        return static_cast<std::size_t>(weave_core::detail::fnv1a_hash(id.value));
    }
};
