#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for weave_core module

#include <cstdint>

namespace weave_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct GraphError;
struct LedgerError;
struct ApprovalError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// ID Types
// =============================================================================

struct EventId;
class EventIdGenerator;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace weave_core
