/// @file id.cpp
/// @brief Event id generation and fingerprinting for weave_core

#include <weave/core/id.hpp>
#include <algorithm>
#include <chrono>
#include <random>

namespace weave_core {

namespace {

/// Per-process session tag so ids from separate runs do not collide in exports
const std::string& session_tag() {
    static const std::string tag = [] {
        std::random_device rd;
        std::uint64_t seed = (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
        return to_hex(seed).substr(0, 8);
    }();
    return tag;
}

EventIdGenerator& default_generator() {
    static EventIdGenerator generator("evt-" + session_tag());
    return generator;
}

} // anonymous namespace

// =============================================================================
// EventId
// =============================================================================

EventId EventId::generate() {
    return default_generator().next();
}

EventIdGenerator::EventIdGenerator(std::string prefix)
    : m_prefix(std::move(prefix)) {}

EventId EventIdGenerator::next() {
    std::uint64_t n = m_next.fetch_add(1, std::memory_order_relaxed);
    return EventId(m_prefix + "-" + std::to_string(n));
}

// =============================================================================
// Fingerprints
// =============================================================================

std::string to_hex(std::uint64_t value) {
    static constexpr char k_digits[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = k_digits[value & 0xF];
        value >>= 4;
    }
    return out;
}

std::string fingerprint(const std::optional<std::string>& snapshot) {
    if (!snapshot) {
        return k_empty_fingerprint;
    }
    return to_hex(detail::fnv1a_hash(*snapshot));
}

std::string fingerprint_ids(std::vector<EventId> ids) {
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    std::string joined;
    for (const auto& id : ids) {
        joined += id.value;
        joined += '\x1f';
    }
    return to_hex(detail::fnv1a_hash(joined));
}

// =============================================================================
// Clock
// =============================================================================

double now_seconds() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

} // namespace weave_core
